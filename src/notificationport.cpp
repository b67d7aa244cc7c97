#include <devnotify/notificationport.hpp>
#include <devnotify/error.hpp>

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace devnotify {

const DeviceHandler& DeviceEventSink::deviceHandler (EventKind kind) const {
    switch (kind) {
        case EventKind::PUBLISH: return onPublish;
        case EventKind::FIRST_PUBLISH: return onFirstPublish;
        case EventKind::MATCHED: return onMatch;
        case EventKind::FIRST_MATCH: return onFirstMatch;
        case EventKind::TERMINATED: return onTerminate;
    }
    throw std::invalid_argument("unknown event kind");
}

const PathHandler& DeviceEventSink::pathHandler (EventKind kind) const {
    switch (kind) {
        case EventKind::PUBLISH: return onPathPublish;
        case EventKind::FIRST_PUBLISH: return onPathFirstPublish;
        case EventKind::MATCHED: return onPathMatch;
        case EventKind::FIRST_MATCH: return onPathFirstMatch;
        case EventKind::TERMINATED: return onPathTerminate;
    }
    throw std::invalid_argument("unknown event kind");
}

bool DeviceEventSink::has (HandlerSlot slot) const {
    return slot.flavor == Flavor::PATH
           ? bool(pathHandler(slot.kind))
           : bool(deviceHandler(slot.kind));
}

// One subscription's handler and cursor. The registry is handed a pointer to this as the
// callback context, so it must stay put for as long as the port lives.
struct NotificationPort::Subscription {
    Subscription (NotificationPort& p, HandlerSlot s, const DeviceEventSink& sink)
        : port(p)
        , slot(s)
    {
        if (slot.flavor == Flavor::PATH) {
            onPaths = sink.pathHandler(slot.kind);
        }
        else {
            onDevices = sink.deviceHandler(slot.kind);
        }
    }

    NotificationPort& port;
    HandlerSlot slot;
    DeviceHandler onDevices;
    PathHandler onPaths;
    Object cursor;
};

NotificationPort::NotificationPort (std::shared_ptr<Registry> registry, Handle masterPort)
    : mRegistry(std::move(registry))
{
    mChannel = mRegistry->createChannel(masterPort);
    if (!mChannel) {
        BOOST_LOG(mLog) << "Could not create a notification channel";
        throw std::runtime_error("Could not create a notification port on the registry.");
    }
    BOOST_LOG(mLog) << "Created notification channel " << mChannel;
}

NotificationPort::~NotificationPort () {
    // Cursors go first: the channel must outlive the subscriptions made on it.
    mSubscriptions.clear();
    mRegistry->destroyChannel(mChannel);
    BOOST_LOG(mLog) << "Destroyed notification channel " << mChannel;
}

NotificationPort::Cursors NotificationPort::addMatchingNotifications (const MatchFilter& filter,
        const DeviceEventSink& sink) {
    boost::system::error_code ec;
    auto cursors = addMatchingNotifications(filter, sink, ec);
    if (ec) {
        throw RegistryError{ec, "IOServiceAddMatchingNotification"};
    }
    return cursors;
}

NotificationPort::Cursors NotificationPort::addMatchingNotifications (const MatchFilter& filter,
        const DeviceEventSink& sink, boost::system::error_code& ec) {
    ec = {};

    for (auto slot : allHandlerSlots()) {
        if (slot.flavor == Flavor::RAW && sink.has(slot)
            && sink.has(HandlerSlot{slot.kind, Flavor::PATH})) {
            throw std::invalid_argument(std::string("both ") + name(slot) + " and "
                + name(HandlerSlot{slot.kind, Flavor::PATH}) + " are set");
        }
        if (sink.has(slot)) {
            // One subscription per event kind and port, whichever flavor holds it.
            for (const auto& sub : mSubscriptions) {
                if (sub->slot.kind == slot.kind) {
                    throw std::invalid_argument(std::string(name(slot)) + ": " + name(sub->slot)
                        + " is already subscribed to " + name(slot.kind) + " on this port");
                }
            }
        }
    }

    auto cursors = Cursors{};
    for (auto slot : allHandlerSlots()) {
        if (!sink.has(slot)) {
            continue;
        }

        auto sub = std::make_unique<Subscription>(*this, slot, sink);
        auto demux = slot.flavor == Flavor::PATH ? &NotificationPort::pathDemux
                                                 : &NotificationPort::deviceDemux;
        Handle cursor = 0;
        auto status = mRegistry->addMatchingNotification(mChannel, slot.kind, filter,
            demux, sub.get(), cursor);
        if (status) {
            ec = makeErrorCode(status);
            BOOST_LOG(mLog) << "Subscribing " << slot << " to " << slot.kind << " on "
                            << filter << " failed: " << ec.message();
            return cursors;
        }

        BOOST_LOG(mLog) << "Subscribed " << slot << " to " << slot.kind << " on " << filter
                        << ", cursor " << cursor;
        sub->cursor = Object{mRegistry, cursor};
        mSubscriptions.push_back(std::move(sub));
        cursors[name(slot)] = cursor;

        // A new subscription only fires once its cursor has been drained. Handing the handler the
        // devices already present does exactly that.
        demux(mSubscriptions.back().get(), cursor);
    }
    return cursors;
}

WaitSource NotificationPort::runLoopSource () {
    if (!mWaitSource) {
        mWaitSource = mRegistry->waitSource(mChannel);
    }
    return mWaitSource;
}

boost::optional<DeviceIterator> NotificationPort::delivered (Subscription& sub, Handle cursor) {
    if (cursor != sub.cursor.get()) {
        BOOST_LOG(mLog) << sub.slot << " delivered cursor " << cursor << ", expected "
                        << sub.cursor.get() << "; ignoring";
        return boost::none;
    }
    BOOST_LOG(mLog) << "Dispatching " << sub.slot.kind << " to " << sub.slot;
    // The iterator shares the subscription's reference to the cursor, so the notification stays
    // armed after the handler is done with it.
    return DeviceIterator{mRegistry, sub.cursor};
}

template <class F>
void NotificationPort::invoke (Subscription& sub, F&& handler) {
    try {
        handler();
    }
    catch (const std::exception& e) {
        // There is nobody to rethrow to: the caller is the registry's event delivery.
        BOOST_LOG(mLog) << sub.slot << " threw: " << e.what();
    }
}

void NotificationPort::deviceDemux (void* context, Handle cursor) {
    auto& sub = *static_cast<Subscription*>(context);
    auto devices = sub.port.delivered(sub, cursor);
    if (devices) {
        sub.port.invoke(sub, [&] { sub.onDevices(*devices); });
    }
}

void NotificationPort::pathDemux (void* context, Handle cursor) {
    auto& sub = *static_cast<Subscription*>(context);
    auto devices = sub.port.delivered(sub, cursor);
    if (devices) {
        auto paths = PathIterator{std::move(*devices)};
        sub.port.invoke(sub, [&] { sub.onPaths(paths); });
    }
}

} // namespace devnotify
