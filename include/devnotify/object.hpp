#ifndef DEVNOTIFY_OBJECT_HPP
#define DEVNOTIFY_OBJECT_HPP

#include <devnotify/registry.hpp>

#include <memory>
#include <utility>

namespace devnotify {

// Handles are plain integers, so the usual shared_ptr<void> trick (i.e., shared_ptr<void>(obj,
// release)) won't work to implement RAII. Instead, we store a non-owning shared_ptr<void> on the
// side that calls Registry::release() once the last copy goes away. The handle is stored in two
// places: in Object for access, and in the deleter for release.
class Object {
public:
    Object () = default;
    Object (std::shared_ptr<Registry> registry, Handle obj)
        : mGuard(obj ? std::shared_ptr<void>(nullptr, [registry, obj] (void*) { registry->release(obj); })
                     : std::shared_ptr<void>{})
        , mObj(obj)
    {}

    Object (const Object&) = default;
    Object& operator= (const Object&) = default;

    Object (Object&& other) noexcept
        : mGuard(std::move(other.mGuard))
        , mObj(other.mObj)
    {
        other.mObj = 0;
    }

    Object& operator= (Object&& other) noexcept {
        if (this != &other) {
            mGuard = std::move(other.mGuard);
            mObj = other.mObj;
            other.mObj = 0;
        }
        return *this;
    }

    Handle get () const { return mObj; }
    operator Handle () const { return mObj; }
    explicit operator bool () const { return mObj != 0; }

    void reset () {
        // Drop this reference. The handle is released if it was the last.
        mGuard.reset();
        mObj = 0;
    }

private:
    std::shared_ptr<void> mGuard;
    Handle mObj = 0;
};

} // namespace devnotify

#endif
