#ifndef CFGDB_CONFIG_DATABASE_CONFIG_HPP
#define CFGDB_CONFIG_DATABASE_CONFIG_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "redis/connection.hpp"

namespace cfgdb {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

struct InstanceInfo {
  std::string hostname{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket_path;
};

struct DatabaseInfo {
  std::string name;
  int id{0};
  char separator{'|'};
  std::string instance;
};

// Catalogue of logical databases and the store instances that host them.
//
// JSON layout:
//   { "INSTANCES": { "redis": { "hostname": "127.0.0.1", "port": 6379,
//                               "unix_socket_path": "/var/run/redis/redis.sock" } },
//     "DATABASES": { "CONFIG_DB": { "id": 4, "separator": "|", "instance": "redis" } } }
class DatabaseConfig {
public:
  static constexpr const char* DEFAULT_INSTANCE = "redis";
  static constexpr const char* DEFAULT_UNIX_SOCKET_PATH = "/var/run/redis/redis.sock";


  // ---- CONSTRUCTION ----
  DatabaseConfig() = default;

  static DatabaseConfig load(const std::string& path);
  static DatabaseConfig parse(std::istream& input);
  static DatabaseConfig defaults();

  void add_instance(const std::string& name, const InstanceInfo& instance);
  void add_database(const DatabaseInfo& database);


  // ---- LOOKUPS ----
  bool has_database(const std::string& name) const;
  const DatabaseInfo& database(const std::string& name) const;
  const InstanceInfo& instance(const std::string& name) const;
  int db_id(const std::string& db_name) const;
  char separator(const std::string& db_name) const;
  // Endpoint of the instance hosting db_name
  redis::Endpoint endpoint(const std::string& db_name, bool use_unix_socket) const;
  std::vector<std::string> database_names() const;

private:
  // ---- PARAMETERS ----
  std::map<std::string, InstanceInfo> instances_;
  std::map<std::string, DatabaseInfo> databases_;
};

} // namespace config
} // namespace cfgdb

#endif // CFGDB_CONFIG_DATABASE_CONFIG_HPP
