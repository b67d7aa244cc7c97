#ifndef DEVNOTIFY_MATCHFILTER_HPP
#define DEVNOTIFY_MATCHFILTER_HPP

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <type_traits>

namespace devnotify {

constexpr const char* kProviderClassKey = "IOProviderClass";
constexpr const char* kUsbVendorIdKey = "idVendor";
constexpr const char* kUsbProductIdKey = "idProduct";

constexpr const char* kUsbDeviceClassName = "IOUSBDevice";
constexpr const char* kUsbHostDeviceClassName = "IOUSBHostDevice";
constexpr const char* kUsbInterfaceClassName = "IOUSBInterface";

using FilterValue = boost::variant<std::string, std::int64_t>;

// A class of devices, described as the registry's matching dictionary: an ordered mapping of
// property keys to string or integer values, always carrying the provider class.
class MatchFilter {
public:
    using Entries = std::map<std::string, FilterValue>;
    using const_iterator = Entries::const_iterator;

    explicit MatchFilter (const std::string& providerClass = kUsbDeviceClassName);

    MatchFilter& set (const std::string& key, const std::string& value);
    MatchFilter& set (const std::string& key, const char* value);

    template <class Integer,
              class = typename std::enable_if<std::is_integral<Integer>::value
                                              && !std::is_same<Integer, bool>::value>::type>
    MatchFilter& set (const std::string& key, Integer value) {
        return setInteger(key, static_cast<std::int64_t>(value));
    }
    // Insert or overwrite. The registry is the judge of which keys and values make sense, except
    // that the provider class must be a string: giving it an integer throws
    // std::invalid_argument.

    MatchFilter& vendorId (std::uint16_t id) { return set(kUsbVendorIdKey, std::int64_t(id)); }
    MatchFilter& productId (std::uint16_t id) { return set(kUsbProductIdKey, std::int64_t(id)); }

    std::string providerClass () const;
    boost::optional<FilterValue> find (const std::string& key) const;

    size_t size () const { return mEntries.size(); }
    const_iterator begin () const { return mEntries.begin(); }
    const_iterator end () const { return mEntries.end(); }

private:
    MatchFilter& setInteger (const std::string& key, std::int64_t value);

    Entries mEntries;
};

std::ostream& operator<< (std::ostream& os, const MatchFilter& filter);
bool operator== (const MatchFilter& a, const MatchFilter& b);

} // namespace devnotify

#endif
