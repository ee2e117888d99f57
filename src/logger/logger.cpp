#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace slicer::logging {

void init_logging(const std::string& log_file, severity min_level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks so repeated initialization does not duplicate output
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    logging::add_console_log(
      std::clog,
      keywords::format = format,
      keywords::auto_flush = true
    );

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

severity parse_severity(const std::string& name) {
  if (name == "trace")   return severity::trace;
  if (name == "debug")   return severity::debug;
  if (name == "info")    return severity::info;
  if (name == "warning" || name == "warn") return severity::warning;
  if (name == "error")   return severity::error;
  if (name == "fatal")   return severity::fatal;
  throw std::invalid_argument("unknown log level: " + name);
}

} // namespace slicer::logging
