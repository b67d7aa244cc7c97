#include <devnotify/deviceiterator.hpp>
#include <devnotify/error.hpp>

#include <utility>

namespace devnotify {

DeviceIterator::DeviceIterator (std::shared_ptr<Registry> registry, Object cursor)
    : mRegistry(std::move(registry))
    , mCursor(std::move(cursor))
{}

boost::optional<Object> DeviceIterator::next () {
    if (!mCursor) {
        return boost::none;
    }
    auto obj = mRegistry->iteratorNext(mCursor);
    if (!obj) {
        release();
        return boost::none;
    }
    return Object{mRegistry, obj};
}

void DeviceIterator::release () {
    mCursor.reset();
}

DeviceIterator matchingServices (std::shared_ptr<Registry> registry, const MatchFilter& filter,
        boost::system::error_code& ec) {
    Handle cursor = 0;
    auto status = registry->matchingServices(filter, cursor);
    if (status) {
        ec = makeErrorCode(status);
        return {};
    }
    ec = {};
    auto obj = Object{registry, cursor};
    return DeviceIterator{std::move(registry), std::move(obj)};
}

DeviceIterator matchingServices (std::shared_ptr<Registry> registry, const MatchFilter& filter) {
    boost::system::error_code ec;
    auto it = matchingServices(std::move(registry), filter, ec);
    if (ec) {
        throw RegistryError{ec, "Could not get matching services from the registry"};
    }
    return it;
}

} // namespace devnotify
