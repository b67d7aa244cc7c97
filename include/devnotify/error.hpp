#ifndef DEVNOTIFY_ERROR_HPP
#define DEVNOTIFY_ERROR_HPP

#include <devnotify/registry.hpp>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>

namespace devnotify {

const boost::system::error_category& registryCategory ();
// Registry return codes, carried verbatim as the error_code's value.

inline boost::system::error_code makeErrorCode (Status status) {
    return boost::system::error_code{status, registryCategory()};
}

struct RegistryError : boost::system::system_error {
    RegistryError (boost::system::error_code ec, const std::string& prefix)
        : boost::system::system_error{ec, prefix}
    {}

    Status status () const { return code().value(); }
};

} // namespace devnotify

#endif
