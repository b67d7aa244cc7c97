#ifndef DEVNOTIFY_LOG_HPP
#define DEVNOTIFY_LOG_HPP

#include <boost/log/common.hpp>
#include <boost/log/sources/logger.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace devnotify { namespace log {

using Logger = boost::log::sources::logger;

boost::program_options::options_description optionsDescription ();
// --log-enable and --log-file, for programs to merge into their own options.

void initialize (const boost::program_options::variables_map& options);
// Configure the Boost.Log core from options parsed with `optionsDescription()`. Call once, before
// anything logs. Logging stays disabled unless --log-enable or --log-file is given.

}} // devnotify::log

#endif
