#include <devnotify/log.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <boost/program_options/value_semantic.hpp>

#include <iostream>
#include <string>

namespace po = boost::program_options;
namespace expr = boost::log::expressions;

namespace devnotify { namespace log {

po::options_description optionsDescription () {
    po::options_description desc{"Logging options"};
    desc.add_options()
        ("log-enable", po::bool_switch()->default_value(false), "write log records to stderr")
        ("log-file", po::value<std::string>(), "write log records to this file")
        ;
    return desc;
}

void initialize (const po::variables_map& options) {
    auto core = boost::log::core::get();
    auto enable = options.count("log-enable") && options["log-enable"].as<bool>();
    auto file = options.count("log-file") ? options["log-file"].as<std::string>() : std::string{};

    if (!enable && file.empty()) {
        core->set_logging_enabled(false);
        return;
    }

    boost::log::add_common_attributes();
    auto format = expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f") << "] "
        << expr::smessage;

    if (enable) {
        boost::log::add_console_log(std::clog, boost::log::keywords::format = format);
    }
    if (!file.empty()) {
        boost::log::add_file_log(
            boost::log::keywords::file_name = file,
            boost::log::keywords::auto_flush = true,
            boost::log::keywords::format = format);
    }
    core->set_logging_enabled(true);
}

}} // devnotify::log
