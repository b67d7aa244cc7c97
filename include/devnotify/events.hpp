#ifndef DEVNOTIFY_EVENTS_HPP
#define DEVNOTIFY_EVENTS_HPP

#include <array>
#include <iosfwd>

namespace devnotify {

enum class EventKind {
    PUBLISH,
    FIRST_PUBLISH,
    MATCHED,
    FIRST_MATCH,
    TERMINATED
};

const char* name (EventKind kind);
// "ServicePublish", "ServiceFirstPublish", "ServiceMatched", "ServiceFirstMatch" or
// "ServiceTerminate".

std::ostream& operator<< (std::ostream& os, EventKind kind);

// Whether a handler wants the raw device handles or the paths they resolve to.
enum class Flavor {
    RAW,
    PATH
};

// One of the ten handler positions on a DeviceEventSink: an EventKind in one Flavor.
struct HandlerSlot {
    EventKind kind;
    Flavor flavor;
};

const char* name (HandlerSlot slot);
// "on_match", "on_path_terminate", and so on.

inline bool operator== (HandlerSlot a, HandlerSlot b) {
    return a.kind == b.kind && a.flavor == b.flavor;
}

inline bool operator!= (HandlerSlot a, HandlerSlot b) {
    return !(a == b);
}

std::ostream& operator<< (std::ostream& os, HandlerSlot slot);

using HandlerSlots = std::array<HandlerSlot, 10>;

const HandlerSlots& allHandlerSlots ();
// Raw slots first, then path slots, each in publish, first-publish, match, first-match,
// terminate order.

} // namespace devnotify

#endif
