#ifndef PNEUMATIC_LOGGER_HPP
#define PNEUMATIC_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace pneumatic::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", ... into a severity level, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

// ---- SINK SETUP ----
// Writes records to a log file, truncated on start
void init_logging(const std::string& log_file = "pneumatic.log",
                  severity_level min_level = severity_level::info);
// Writes records to stderr
void init_console_logging(severity_level min_level = severity_level::warning);

// ---- FILTERING ----
void set_log_level(severity_level min_level);

} // namespace pneumatic::logging

#endif // PNEUMATIC_LOGGER_HPP
