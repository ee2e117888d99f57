#ifndef SLICER_LOGGER_HPP
#define SLICER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace slicer::logging {

using severity = boost::log::trivial::severity_level;

// Sets up the console sink and, when log_file is not empty, a rotating file sink
void init_logging(const std::string& log_file = "", severity min_level = severity::info);

// Changes the minimum severity accepted by the core
void set_log_level(severity min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
// Throws std::invalid_argument on anything else
severity parse_severity(const std::string& name);

} // namespace slicer::logging

#endif // SLICER_LOGGER_HPP
