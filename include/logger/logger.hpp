#ifndef DAGSYNC_LOGGER_HPP
#define DAGSYNC_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace dagsync::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal".
// Throws std::invalid_argument for anything else.
severity_level severity_from_string(const std::string& name);

// Replaces every sink with a synchronous text file sink
void init_logging(const std::string& log_file = "dagsync.log",
                  severity_level min_level = severity_level::info);

// Replaces every sink with a console (stderr) sink
void init_console_logging(severity_level min_level = severity_level::warning);

} // namespace dagsync::logging

#endif // DAGSYNC_LOGGER_HPP
