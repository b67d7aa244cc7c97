#include <devnotify/events.hpp>

#include <iostream>

namespace devnotify {

const char* name (EventKind kind) {
    switch (kind) {
        case EventKind::PUBLISH: return "ServicePublish";
        case EventKind::FIRST_PUBLISH: return "ServiceFirstPublish";
        case EventKind::MATCHED: return "ServiceMatched";
        case EventKind::FIRST_MATCH: return "ServiceFirstMatch";
        case EventKind::TERMINATED: return "ServiceTerminate";
    }
    return "(unknown event kind)";
}

std::ostream& operator<< (std::ostream& os, EventKind kind) {
    return os << name(kind);
}

const char* name (HandlerSlot slot) {
    auto path = slot.flavor == Flavor::PATH;
    switch (slot.kind) {
        case EventKind::PUBLISH: return path ? "on_path_publish" : "on_publish";
        case EventKind::FIRST_PUBLISH: return path ? "on_path_first_publish" : "on_first_publish";
        case EventKind::MATCHED: return path ? "on_path_match" : "on_match";
        case EventKind::FIRST_MATCH: return path ? "on_path_first_match" : "on_first_match";
        case EventKind::TERMINATED: return path ? "on_path_terminate" : "on_terminate";
    }
    return "(unknown handler slot)";
}

std::ostream& operator<< (std::ostream& os, HandlerSlot slot) {
    return os << name(slot);
}

const HandlerSlots& allHandlerSlots () {
    static const HandlerSlots slots = {{
        {EventKind::PUBLISH, Flavor::RAW},
        {EventKind::FIRST_PUBLISH, Flavor::RAW},
        {EventKind::MATCHED, Flavor::RAW},
        {EventKind::FIRST_MATCH, Flavor::RAW},
        {EventKind::TERMINATED, Flavor::RAW},
        {EventKind::PUBLISH, Flavor::PATH},
        {EventKind::FIRST_PUBLISH, Flavor::PATH},
        {EventKind::MATCHED, Flavor::PATH},
        {EventKind::FIRST_MATCH, Flavor::PATH},
        {EventKind::TERMINATED, Flavor::PATH},
    }};
    return slots;
}

} // namespace devnotify
