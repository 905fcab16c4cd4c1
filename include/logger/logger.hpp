#ifndef GHOSTNET_LOGGER_HPP
#define GHOSTNET_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace ghostnet::logging {

using severity_level = boost::log::trivial::severity_level;

// Initialize logging with a rotating file sink and an optional console sink
void init_logging(const std::string& log_file = "ghostnet.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Initialize console-only logging (used by tests and the --verbose host)
void init_console_logging(severity_level min_level = boost::log::trivial::debug);

// ---- RUNTIME CONTROL ----
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Parse "trace", "debug", "info", "warning", "error", "fatal"
severity_level parse_severity(const std::string& name);

} // namespace ghostnet::logging

#endif // GHOSTNET_LOGGER_HPP
