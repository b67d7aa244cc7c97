#include <devnotify/error.hpp>

#include <cstdint>
#include <cstdio>

namespace devnotify {

namespace {

// A few of the I/O Kit's common return codes (IOKit/IOReturn.h), the ones a matching request is
// likely to produce.
const char* knownStatusString (std::uint32_t status) {
    switch (status) {
        case 0xe00002bc: return "general error";
        case 0xe00002bd: return "can't allocate memory";
        case 0xe00002be: return "resource shortage";
        case 0xe00002bf: return "error during IPC";
        case 0xe00002c0: return "no such device";
        case 0xe00002c1: return "privilege violation";
        case 0xe00002c2: return "invalid argument";
        case 0xe00002c7: return "unsupported function";
        case 0xe00002e2: return "not permitted";
        default: return nullptr;
    }
}

class RegistryCategory : public boost::system::error_category {
public:
    const char* name () const noexcept override {
        return "devnotify.registry";
    }

    std::string message (int ev) const override {
        char code[32];
        std::snprintf(code, sizeof(code), "0x%08x", unsigned(ev));
        auto known = knownStatusString(std::uint32_t(ev));
        return std::string("registry status ") + code + (known ? std::string(" (") + known + ")" : "");
    }
};

} // <anonymous>

const boost::system::error_category& registryCategory () {
    static const RegistryCategory category{};
    return category;
}

} // namespace devnotify
