#ifndef DEVNOTIFY_DEVICEITERATOR_HPP
#define DEVNOTIFY_DEVICEITERATOR_HPP

#include <devnotify/object.hpp>
#include <devnotify/pulliterator.hpp>
#include <devnotify/registry.hpp>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include <memory>

namespace devnotify {

// A one-shot, forward-only walk over a registry iteration cursor. The iterator holds a reference
// to the cursor until it is exhausted, released, or destroyed, whichever comes first. It has a
// single consumer, so it can be moved but not copied.
class DeviceIterator {
public:
    using iterator = PullIterator<DeviceIterator, Object>;

    DeviceIterator () = default;
    DeviceIterator (std::shared_ptr<Registry> registry, Object cursor);

    DeviceIterator (DeviceIterator&&) = default;
    DeviceIterator& operator= (DeviceIterator&&) = default;
    // The moved-from iterator is left exhausted.

    DeviceIterator (const DeviceIterator&) = delete;
    DeviceIterator& operator= (const DeviceIterator&) = delete;

    boost::optional<Object> next ();
    // The next device, or none once the cursor is exhausted. Exhaustion is permanent: the cursor
    // is not consulted again, even if the registry has since queued more devices on it.

    void release ();
    // Drop the cursor now instead of at destruction. Safe to call repeatedly.

    bool exhausted () const { return !mCursor; }
    const std::shared_ptr<Registry>& registry () const { return mRegistry; }

    iterator begin () { return iterator{*this}; }
    iterator end () { return iterator{}; }

private:
    std::shared_ptr<Registry> mRegistry;
    Object mCursor;
};

DeviceIterator matchingServices (std::shared_ptr<Registry> registry, const MatchFilter& filter);
// The devices currently matching `filter`. Throws RegistryError if the lookup fails.

DeviceIterator matchingServices (std::shared_ptr<Registry> registry, const MatchFilter& filter,
    boost::system::error_code& ec);

} // namespace devnotify

#endif
