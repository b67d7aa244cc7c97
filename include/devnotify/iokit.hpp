#ifndef DEVNOTIFY_IOKIT_HPP
#define DEVNOTIFY_IOKIT_HPP

#include <boost/predef.h>

#if !BOOST_OS_MACOS
#error devnotify/iokit.hpp is a macOS-specific header file.
#endif

#include <devnotify/registry.hpp>

#include <memory>

namespace devnotify { namespace iokit {

std::shared_ptr<Registry> registry ();
// The I/O Kit registry, shared by every caller in the process.

const char* usbDeviceClassName ();
// The provider class of USB devices on the running system: IOUSBHostDevice on OS X 10.11 (Darwin
// 15) and later, IOUSBDevice before.

}} // devnotify::iokit

#endif
