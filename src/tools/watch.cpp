// Print the callout device paths of matching USB devices as they come and go.
//
//     devnotify-watch --vendor-id 0x0451 --product-id 0xf432

#include <devnotify/iokit.hpp>
#include <devnotify/log.hpp>
#include <devnotify/notificationport.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <CoreFoundation/CoreFoundation.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

std::uint16_t parseId (const std::string& s) {
    // Accepts 0x-prefixed hex, leading-zero octal and decimal, like strtoul with base 0.
    size_t n = 0;
    auto id = std::stoul(s, &n, 0);
    if (n != s.size() || id > 0xffff) {
        throw po::invalid_option_value{s};
    }
    return std::uint16_t(id);
}

void printPaths (devnotify::PathIterator& paths, const char* what) {
    for (const auto& path : paths) {
        std::cout << path << ' ' << what << '\n';
    }
    std::cout.flush();
}

void printDevices (devnotify::DeviceIterator& devices, const char* what) {
    for (const auto& device : devices) {
        std::cout << "device " << device.get() << ' ' << what << '\n';
    }
    std::cout.flush();
}

} // <anonymous>

int main (int argc, char** argv) try {
    auto desc = po::options_description{"devnotify-watch options"};
    desc.add_options()
        ("help", "print this message")
        ("provider-class", po::value<std::string>(), "provider class to match (default: the USB device class of this system)")
        ("vendor-id", po::value<std::string>()->default_value("0x0451"), "USB vendor ID")
        ("product-id", po::value<std::string>()->default_value("0xf432"), "USB product ID")
        ("raw", po::bool_switch()->default_value(false), "print registry handles instead of paths")
        ;
    desc.add(devnotify::log::optionsDescription());

    auto options = po::variables_map{};
    po::store(po::parse_command_line(argc, argv, desc), options);
    po::notify(options);

    if (options.count("help")) {
        std::cout << desc << '\n';
        return EXIT_SUCCESS;
    }

    devnotify::log::initialize(options);

    auto filter = devnotify::MatchFilter{options.count("provider-class")
        ? options["provider-class"].as<std::string>()
        : std::string(devnotify::iokit::usbDeviceClassName())};
    filter.vendorId(parseId(options["vendor-id"].as<std::string>()))
          .productId(parseId(options["product-id"].as<std::string>()));

    auto sink = devnotify::DeviceEventSink{};
    if (options["raw"].as<bool>()) {
        sink.onMatch = [] (devnotify::DeviceIterator& devices) { printDevices(devices, "matched"); };
        sink.onTerminate = [] (devnotify::DeviceIterator& devices) { printDevices(devices, "terminated"); };
    }
    else {
        sink.onPathMatch = [] (devnotify::PathIterator& paths) { printPaths(paths, "matched"); };
        sink.onPathTerminate = [] (devnotify::PathIterator& paths) { printPaths(paths, "terminated"); };
    }

    std::cerr << "Watching " << filter << '\n';

    devnotify::NotificationPort port{devnotify::iokit::registry()};
    port.addMatchingNotifications(filter, sink);

    auto source = port.runLoopSource();
    CFRunLoopAddSource(CFRunLoopGetCurrent(),
        static_cast<CFRunLoopSourceRef>(source.native()), kCFRunLoopDefaultMode);
    CFRunLoopRun();
    return EXIT_SUCCESS;
}
catch (const std::exception& e) {
    std::cerr << "devnotify-watch: " << e.what() << '\n';
    return EXIT_FAILURE;
}
