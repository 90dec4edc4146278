#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace cfgdb {
namespace logging {

void init_logging(const LogSettings& settings) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto formatter = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    if (settings.console) {
      logging::add_console_log(
        std::clog,
        keywords::format = formatter,
        keywords::auto_flush = true
      );
    }

    if (!settings.log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(settings.log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = formatter,
        keywords::rotation_size = settings.rotation_size,
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::auto_flush = true
      );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= settings.min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging system initialized";
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
  boost::log::trivial::severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Logger: Unknown severity level: " + name);
  }
  return level;
}

} // namespace logging
} // namespace cfgdb
