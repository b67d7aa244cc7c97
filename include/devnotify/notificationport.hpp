#ifndef DEVNOTIFY_NOTIFICATIONPORT_HPP
#define DEVNOTIFY_NOTIFICATIONPORT_HPP

#include <devnotify/deviceiterator.hpp>
#include <devnotify/events.hpp>
#include <devnotify/log.hpp>
#include <devnotify/matchfilter.hpp>
#include <devnotify/object.hpp>
#include <devnotify/pathiterator.hpp>
#include <devnotify/registry.hpp>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace devnotify {

using DeviceHandler = std::function<void(DeviceIterator&)>;
using PathHandler = std::function<void(PathIterator&)>;

// The handlers to subscribe, one optional slot per event kind and flavor. Leave a slot empty to
// not subscribe to it. The raw handlers receive the devices themselves, the path handlers their
// callout device paths. Populating both flavors of one event kind is an error.
struct DeviceEventSink {
    DeviceHandler onPublish;
    DeviceHandler onFirstPublish;
    DeviceHandler onMatch;
    DeviceHandler onFirstMatch;
    DeviceHandler onTerminate;

    PathHandler onPathPublish;
    PathHandler onPathFirstPublish;
    PathHandler onPathMatch;
    PathHandler onPathFirstMatch;
    PathHandler onPathTerminate;

    const DeviceHandler& deviceHandler (EventKind kind) const;
    const PathHandler& pathHandler (EventKind kind) const;
    bool has (HandlerSlot slot) const;
};

// A registry notification channel and the subscriptions made on it. Events are delivered
// through the channel's wait source, which the caller adds to its event loop; handlers then run
// synchronously on the thread pumping that loop.
class NotificationPort {
public:
    using Cursors = std::map<std::string, Handle>;

    explicit NotificationPort (std::shared_ptr<Registry> registry, Handle masterPort = 0);
    // Throws std::runtime_error if the registry cannot create a channel.

    ~NotificationPort ();
    // Releases every subscription and destroys the channel. Undelivered events are dropped.

    NotificationPort (const NotificationPort&) = delete;
    NotificationPort& operator= (const NotificationPort&) = delete;

    Cursors addMatchingNotifications (const MatchFilter& filter, const DeviceEventSink& sink);
    // Subscribe every populated slot of `sink` to events for devices matching `filter`, and
    // return the subscription cursors keyed by slot name ("on_match", "on_path_terminate", ...).
    // Each handler is called once right away with the devices already present, which also arms
    // its subscription. A port holds at most one subscription per event kind: throws
    // std::invalid_argument, before subscribing anything, if `sink` populates both flavors of an
    // event kind or a kind this port is already subscribed to. Throws RegistryError if the
    // registry refuses a subscription, in which case the subscriptions made before the failing
    // one remain active.

    Cursors addMatchingNotifications (const MatchFilter& filter, const DeviceEventSink& sink,
        boost::system::error_code& ec);
    // As above, but a registry failure is reported through `ec`, and the cursors of the
    // subscriptions made before the failure are returned.

    WaitSource runLoopSource ();
    // Every call returns the same source.

    size_t subscriptionCount () const { return mSubscriptions.size(); }

private:
    struct Subscription;

    static void deviceDemux (void* context, Handle cursor);
    static void pathDemux (void* context, Handle cursor);
    boost::optional<DeviceIterator> delivered (Subscription& sub, Handle cursor);
    template <class F>
    void invoke (Subscription& sub, F&& handler);

    std::shared_ptr<Registry> mRegistry;
    Channel mChannel = nullptr;
    WaitSource mWaitSource;
    std::vector<std::unique_ptr<Subscription>> mSubscriptions;
    log::Logger mLog;
};

} // namespace devnotify

#endif
