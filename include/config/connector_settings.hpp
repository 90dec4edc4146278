#ifndef CFGDB_CONFIG_CONNECTOR_SETTINGS_HPP
#define CFGDB_CONFIG_CONNECTOR_SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace cfgdb {
namespace config {

// Tuning for connections, retries and notification waits. Passed explicitly to
// the registry; there is no process-wide copy.
struct ConnectorSettings {
  // Wait before reconnecting after a connection failure
  std::chrono::milliseconds connect_retry_wait{std::chrono::seconds(10)};
  // Settling delay after the awaited notification arrives
  std::chrono::milliseconds data_retrieval_wait{std::chrono::seconds(3)};
  // Time to wait for any single pub/sub message
  std::chrono::milliseconds notification_timeout{std::chrono::seconds(10)};
  // Total time a blocking read waits for its data to appear
  std::chrono::milliseconds maximum_data_wait{std::chrono::seconds(60)};

  // Consecutive connection failures strictly between these two log at error level
  int error_threshold{10};
  int error_suppression{15};

  std::size_t scan_batch_size{30};

  std::string keyspace_events{"KEA"};
  std::string keyspace_pattern{"__key*__:*"};

  std::chrono::milliseconds connect_timeout{std::chrono::seconds(2)};
  std::chrono::milliseconds command_timeout{std::chrono::seconds(5)};

  // Connect through the instance's unix socket instead of TCP
  bool use_unix_socket{false};
  // Separator for databases missing from the catalogue
  char default_separator{'|'};
};

} // namespace config
} // namespace cfgdb

#endif // CFGDB_CONFIG_CONNECTOR_SETTINGS_HPP
