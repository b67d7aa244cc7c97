#include <devnotify/pathiterator.hpp>

namespace devnotify {

boost::optional<std::string> PathResolver::resolve (Registry& registry, Handle device) const {
    if (!device) {
        return boost::none;
    }
    auto value = registry.searchStringProperty(device, mPlane, mKey, mOptions);
    if (value && value->empty()) {
        return boost::none;
    }
    return value;
}

boost::optional<std::string> PathIterator::next () {
    while (auto device = mDevices.next()) {
        auto path = mResolver.resolve(*mDevices.registry(), *device);
        if (path) {
            return path;
        }
    }
    return boost::none;
}

} // namespace devnotify
