#include <doctest/doctest.h>

#include <devnotify/matchfilter.hpp>

#include <boost/optional/optional_io.hpp>

#include <sstream>
#include <stdexcept>

namespace {

using devnotify::FilterValue;
using devnotify::MatchFilter;

TEST_CASE("a new filter holds exactly the provider class") {
    auto filter = MatchFilter{"USBDevice"};
    CHECK(filter.size() == 1);
    CHECK(filter.providerClass() == "USBDevice");
    REQUIRE(bool(filter.find(devnotify::kProviderClassKey)));
    CHECK(*filter.find(devnotify::kProviderClassKey) == FilterValue{std::string("USBDevice")});
}

TEST_CASE("the default provider class is IOUSBDevice") {
    CHECK(MatchFilter{}.providerClass() == "IOUSBDevice");
}

TEST_CASE("set inserts and overwrites") {
    auto filter = MatchFilter{"USBDevice"};
    filter.set("idVendor", std::int64_t(1)).set("idVendor", std::int64_t(0x0451));
    filter.set("kUSBSerialNumberString", "A700ezxq");
    CHECK(filter.size() == 3);
    CHECK(*filter.find("idVendor") == FilterValue{std::int64_t(0x0451)});
    // A string literal must not decay into an integer value.
    CHECK(*filter.find("kUSBSerialNumberString") == FilterValue{std::string("A700ezxq")});
    CHECK_FALSE(bool(filter.find("idProduct")));
}

TEST_CASE("vendorId and productId write the USB keys") {
    auto filter = MatchFilter{"USBDevice"};
    filter.vendorId(0x0451).productId(0xf432);
    CHECK(*filter.find("idVendor") == FilterValue{std::int64_t(0x0451)});
    CHECK(*filter.find("idProduct") == FilterValue{std::int64_t(0xf432)});
}

TEST_CASE("the provider class can be overwritten") {
    auto filter = MatchFilter{"USBDevice"};
    filter.set(devnotify::kProviderClassKey, "IOUSBInterface");
    CHECK(filter.size() == 1);
    CHECK(filter.providerClass() == "IOUSBInterface");
}

TEST_CASE("plain integers set integer values") {
    auto filter = MatchFilter{"USBDevice"};
    filter.set("bDeviceClass", 0).set("idVendor", 0x0451u).set("locationID", 0x14100000L);
    CHECK(*filter.find("bDeviceClass") == FilterValue{std::int64_t(0)});
    CHECK(*filter.find("idVendor") == FilterValue{std::int64_t(0x0451)});
    CHECK(*filter.find("locationID") == FilterValue{std::int64_t(0x14100000)});
}

TEST_CASE("an integer provider class is rejected") {
    auto filter = MatchFilter{"USBDevice"};
    CHECK_THROWS_AS(filter.set(devnotify::kProviderClassKey, 42), std::invalid_argument);
    CHECK(filter.providerClass() == "USBDevice");
    CHECK(filter.size() == 1);
}

TEST_CASE("filters print in key order") {
    auto filter = MatchFilter{"USBDevice"};
    filter.vendorId(0x0451).productId(0xf432);
    std::ostringstream os;
    os << filter << ' ' << 10;
    CHECK(os.str() == "{IOProviderClass: 'USBDevice', idProduct: 0xf432, idVendor: 0x0451} 10");
}

TEST_CASE("filters with the same entries compare equal") {
    auto a = MatchFilter{"USBDevice"};
    auto b = MatchFilter{"USBDevice"};
    a.vendorId(0x0451);
    CHECK_FALSE(a == b);
    b.vendorId(0x0451);
    CHECK(a == b);
}

}  // <anonymous>
