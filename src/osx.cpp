#include <devnotify/iokit.hpp>
#include <devnotify/matchfilter.hpp>

#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/variant/static_visitor.hpp>

#include "CF++.h"

#include <IOKit/IOKitLib.h>
#include <IOKit/IOReturn.h>

#include <sys/sysctl.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace devnotify { namespace iokit {

static_assert(std::is_same<io_object_t, Handle>::value,
    "devnotify::Handle must be able to hold an io_object_t");

static unsigned darwinVersionMajor () {
    static auto v = [] {
        char osRelease[256];
        size_t osReleaseSize = sizeof(osRelease);
        auto rc = sysctlbyname("kern.osrelease", osRelease, &osReleaseSize, nullptr, 0);
        if (rc) {
            throw std::runtime_error("Error getting Darwin version string with sysctlbyname");
        }
        // osReleaseSize counts the terminating NUL.
        auto darwinVersionString = std::string(osRelease);

        std::vector<decltype(darwinVersionString)> splitResult;
        using CharT = decltype(darwinVersionString)::value_type;
        boost::split(splitResult, darwinVersionString, [] (CharT c) { return c == '.'; });
        if (splitResult.size() < 3) {
            throw std::runtime_error("Error parsing Darwin version string");
        }
        return boost::lexical_cast<unsigned>(splitResult[0]);
    }();
    return v;
}

const char* usbDeviceClassName () {
    // OS X 10.11 (Darwin 15) overhauled the USB system, introducing the
    // IOUSBHostDevice class name.
    return darwinVersionMajor() < 15 ? kUsbDeviceClassName : kUsbHostDeviceClassName;
}

namespace {

const char* notificationType (EventKind kind) {
    switch (kind) {
        case EventKind::PUBLISH: return kIOPublishNotification;
        case EventKind::FIRST_PUBLISH: return kIOFirstPublishNotification;
        case EventKind::MATCHED: return kIOMatchedNotification;
        case EventKind::FIRST_MATCH: return kIOFirstMatchNotification;
        case EventKind::TERMINATED: return kIOTerminatedNotification;
    }
    throw std::invalid_argument("unknown event kind");
}

struct SetDictionaryValue : boost::static_visitor<void> {
    CFMutableDictionaryRef dict;
    CF::String key;

    SetDictionaryValue (CFMutableDictionaryRef d, const std::string& k) : dict(d), key(k) {}

    void operator() (const std::string& value) const {
        auto cfValue = CF::String{value};
        CFDictionarySetValue(dict, key.GetCFObject(), cfValue.GetCFObject());
    }

    void operator() (std::int64_t value) const {
        auto cfValue = CF::Number{static_cast<SInt64>(value)};
        CFDictionarySetValue(dict, key.GetCFObject(), cfValue.GetCFObject());
    }
};

// Every I/O Kit matching call consumes one reference to its dictionary, so each call gets a
// freshly built one.
CFMutableDictionaryRef matchingDictionary (const MatchFilter& filter) {
    auto dict = IOServiceMatching(filter.providerClass().c_str());
    if (!dict) {
        throw std::runtime_error("IOServiceMatching failed");
    }
    for (const auto& entry : filter) {
        if (entry.first != kProviderClassKey) {
            boost::apply_visitor(SetDictionaryValue{dict, entry.first}, entry.second);
        }
    }
    return dict;
}

IONotificationPortRef notificationPort (Channel channel) {
    return static_cast<IONotificationPortRef>(channel);
}

class IoKitRegistry : public Registry {
public:
    Channel createChannel (Handle masterPort) override {
        return IONotificationPortCreate(masterPort);
    }

    void destroyChannel (Channel channel) override {
        IONotificationPortDestroy(notificationPort(channel));
    }

    WaitSource waitSource (Channel channel) override {
        // Owned by the notification port; not to be released.
        return WaitSource{IONotificationPortGetRunLoopSource(notificationPort(channel))};
    }

    Status addMatchingNotification (Channel channel, EventKind kind, const MatchFilter& filter,
            NotificationCallback callback, void* context, Handle& cursor) override {
        io_iterator_t iter = 0;
        auto kr = IOServiceAddMatchingNotification(notificationPort(channel),
            notificationType(kind), matchingDictionary(filter), callback, context, &iter);
        cursor = iter;
        return kr;
    }

    Status matchingServices (const MatchFilter& filter, Handle& cursor) override {
        io_iterator_t iter = 0;
        auto kr = IOServiceGetMatchingServices(kIOMasterPortDefault,
            matchingDictionary(filter), &iter);
        cursor = iter;
        return kr;
    }

    Handle iteratorNext (Handle cursor) override {
        return IOIteratorIsValid(cursor) ? IOIteratorNext(cursor) : 0;
    }

    void release (Handle object) override {
        IOObjectRelease(object);
    }

    boost::optional<std::string> searchStringProperty (Handle entry, const std::string& plane,
            const std::string& key, std::uint32_t options) override {
        auto valueRef = IORegistryEntrySearchCFProperty(entry,
            plane.c_str(), CF::String{key},
            kCFAllocatorDefault, options);
        if (!valueRef) {
            return boost::none;
        }
        auto value = CF::String{valueRef};
        CFRelease(valueRef);
        // CF::String is empty if the property was not a string.
        auto s = std::string(value);
        if (s.empty()) {
            return boost::none;
        }
        return s;
    }
};

} // <anonymous>

std::shared_ptr<Registry> registry () {
    static auto r = std::make_shared<IoKitRegistry>();
    return r;
}

}} // devnotify::iokit
