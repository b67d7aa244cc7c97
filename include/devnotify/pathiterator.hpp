#ifndef DEVNOTIFY_PATHITERATOR_HPP
#define DEVNOTIFY_PATHITERATOR_HPP

#include <devnotify/deviceiterator.hpp>
#include <devnotify/pulliterator.hpp>
#include <devnotify/registry.hpp>

#include <boost/optional.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace devnotify {

// Turns a device handle into a string property found by searching the registry from that device,
// by default the callout device path (/dev/cu.*) of a serial port somewhere below it.
class PathResolver {
public:
    explicit PathResolver (std::string key = kCalloutDeviceKey,
            std::string plane = kServicePlane,
            std::uint32_t options = kSearchRecursively)
        : mKey(std::move(key)), mPlane(std::move(plane)), mOptions(options)
    {}

    boost::optional<std::string> resolve (Registry& registry, Handle device) const;
    // One property search. None if the property is absent or the handle is invalid.

    const std::string& key () const { return mKey; }
    const std::string& plane () const { return mPlane; }
    std::uint32_t options () const { return mOptions; }

private:
    std::string mKey;
    std::string mPlane;
    std::uint32_t mOptions;
};

// The paths of the devices of a DeviceIterator, resolved lazily one at a time. Devices without a
// path are skipped.
class PathIterator {
public:
    using iterator = PullIterator<PathIterator, std::string>;

    explicit PathIterator (DeviceIterator devices, PathResolver resolver = PathResolver{})
        : mDevices(std::move(devices)), mResolver(std::move(resolver))
    {}

    PathIterator (PathIterator&&) = default;
    PathIterator& operator= (PathIterator&&) = default;

    PathIterator (const PathIterator&) = delete;
    PathIterator& operator= (const PathIterator&) = delete;

    boost::optional<std::string> next ();
    // The next resolvable device's path, or none once the devices are exhausted.

    bool exhausted () const { return mDevices.exhausted(); }

    iterator begin () { return iterator{*this}; }
    iterator end () { return iterator{}; }

private:
    DeviceIterator mDevices;
    PathResolver mResolver;
};

} // namespace devnotify

#endif
