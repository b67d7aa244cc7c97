#ifndef DEVNOTIFY_REGISTRY_HPP
#define DEVNOTIFY_REGISTRY_HPP

#include <devnotify/events.hpp>
#include <devnotify/matchfilter.hpp>

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

namespace devnotify {

// Registry objects (devices, iterators, ports) are named by integers the width of a Mach port
// name, so an io_object_t converts without loss. Zero is the null object.
using Handle = unsigned int;

// A registry return code, zero on success (kern_return_t on macOS).
using Status = std::int32_t;

// An opaque notification channel (IONotificationPortRef on macOS).
using Channel = void*;

// Called by the registry whenever a subscription has new devices to report. `context` is the
// pointer given at subscription time, `cursor` the subscription's iteration cursor.
using NotificationCallback = void (*)(void* context, Handle cursor);

constexpr const char* kServicePlane = "IOService";
constexpr const char* kCalloutDeviceKey = "IOCalloutDevice";
constexpr const char* kBsdNameKey = "BSD Name";

enum SearchOptions : std::uint32_t {
    kSearchNoOptions = 0,
    kSearchRecursively = 0x00000001,
    kSearchParents = 0x00000002
};

// "This channel has pending events", in whatever form the caller's event loop consumes
// (a CFRunLoopSourceRef on macOS). Two WaitSources are equal if they name the same source.
class WaitSource {
public:
    WaitSource () = default;
    explicit WaitSource (void* native) : mNative(native) {}
    void* native () const { return mNative; }
    explicit operator bool () const { return mNative != nullptr; }
private:
    void* mNative = nullptr;
};

inline bool operator== (const WaitSource& a, const WaitSource& b) {
    return a.native() == b.native();
}

inline bool operator!= (const WaitSource& a, const WaitSource& b) {
    return !(a == b);
}

// The operating system's device registry: the service NotificationPort, DeviceIterator and
// PathResolver are built on. Implementations forward each call to the OS; tests substitute a
// scripted one.
class Registry {
public:
    virtual ~Registry () = default;

    virtual Channel createChannel (Handle masterPort) = 0;
    // Returns nullptr if the channel could not be created.
    virtual void destroyChannel (Channel channel) = 0;
    virtual WaitSource waitSource (Channel channel) = 0;

    virtual Status addMatchingNotification (Channel channel, EventKind kind,
        const MatchFilter& filter, NotificationCallback callback, void* context,
        Handle& cursor) = 0;
    // Subscribe to `kind` events for devices matching `filter`. On success, `cursor` receives the
    // subscription's iteration cursor, which the caller must eventually release. The registry
    // keeps its own copy of `filter`.

    virtual Status matchingServices (const MatchFilter& filter, Handle& cursor) = 0;
    // Look up the devices currently matching `filter`. On success, `cursor` receives an iteration
    // cursor over them.

    virtual Handle iteratorNext (Handle cursor) = 0;
    // Returns the next object of the iteration, or zero once there are no more. A non-zero result
    // is a new reference the caller must release.

    virtual void release (Handle object) = 0;

    virtual boost::optional<std::string> searchStringProperty (Handle entry,
        const std::string& plane, const std::string& key, std::uint32_t options) = 0;
    // Returns none if no entry in the search scope has `key`, its value is not a string, or
    // `entry` is not a valid object.
};

} // namespace devnotify

#endif
