#ifndef CFGDB_LOGGER_HPP
#define CFGDB_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace logging {

struct LogSettings {
  // Empty path disables the file sink
  std::string log_file;
  bool console{true};
  boost::log::trivial::severity_level min_level{boost::log::trivial::info};
  // Rotation size for the file sink in bytes
  std::size_t rotation_size{10 * 1024 * 1024};
};

// Replaces all Boost.Log sinks with the ones described by settings
void init_logging(const LogSettings& settings);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace cfgdb

#endif // CFGDB_LOGGER_HPP
