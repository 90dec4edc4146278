#ifndef CFGDB_DB_CONNECTION_REGISTRY_HPP
#define CFGDB_DB_CONNECTION_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "config/connector_settings.hpp"
#include "config/database_config.hpp"
#include "db/db_error.hpp"
#include "redis/client.hpp"
#include "utils/cancellation.hpp"

namespace cfgdb {
namespace db {

// Live state for one logical database
struct DatabaseHandle {
  std::string name;
  int id{0};
  char separator{'|'};
  std::shared_ptr<redis::Client> client;
  // Keyspace notification channel, open only while a blocking read waits
  std::unique_ptr<redis::Subscription> notifications;
};

// Creates a connected client for (db_name, db_id). Throws ConnectionError on failure.
using ClientFactory = std::function<std::shared_ptr<redis::Client>(const std::string& db_name, int db_id)>;

// Owns one live client per logical database name
class ConnectionRegistry {
public:
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Uses RedisClient endpoints from the catalogue
  ConnectionRegistry(config::DatabaseConfig catalogue, config::ConnectorSettings settings);
  ConnectionRegistry(config::DatabaseConfig catalogue, config::ConnectorSettings settings,
                     ClientFactory factory);
  ~ConnectionRegistry();


  // ---- CONNECTION MANAGEMENT ----
  // With retry_forever false a single attempt is made and ConnectionError
  // propagates. Otherwise attempts repeat until success or cancellation,
  // including attempts whose setup commands were rejected (SchemaError).
  void connect(int db_id, const std::string& db_name, bool retry_forever,
               utils::CancellationToken& cancel = utils::CancellationToken::none());
  // Looks the id up in the catalogue
  void connect(const std::string& db_name, bool retry_forever,
               utils::CancellationToken& cancel = utils::CancellationToken::none());
  // Closes the client and its notification channel. Idempotent.
  void close(const std::string& db_name);
  void close_all();
  // Closes and reconnects persistently with the id used last time
  void reconnect(const std::string& db_name,
                 utils::CancellationToken& cancel = utils::CancellationToken::none());


  // ---- CLIENT LOOKUP ----
  // Throws MissingClientError for unregistered names
  std::shared_ptr<redis::Client> client(const std::string& db_name) const;
  bool is_registered(const std::string& db_name) const;
  bool is_connected(const std::string& db_name) const;
  int db_id(const std::string& db_name) const;
  char separator(const std::string& db_name) const;


  // ---- KEYSPACE NOTIFICATIONS ----
  void subscribe_keyspace(const std::string& db_name);
  void unsubscribe_keyspace(const std::string& db_name);
  bool has_subscription(const std::string& db_name) const;
  // Throws MissingClientError when no channel is open
  redis::Subscription& subscription(const std::string& db_name);


  // ---- GETTERS ----
  const config::ConnectorSettings& get_settings() const { return settings_; }
  const config::DatabaseConfig& get_catalogue() const { return catalogue_; }

private:
  // ---- PARAMETERS ----
  config::DatabaseConfig catalogue_;
  config::ConnectorSettings settings_;
  ClientFactory factory_;

  std::map<std::string, DatabaseHandle> handles_;
  // Remembers name -> id across close() so reconnect() knows where to go
  std::map<std::string, int> db_ids_;
  mutable std::mutex mutex_;


  // ---- CONNECTION HELPERS ----
  void onetime_connect(int db_id, const std::string& db_name);
  void persistent_connect(int db_id, const std::string& db_name, utils::CancellationToken& cancel);
  void wait_before_retry(int db_id, const std::string& db_name, const DbError& error,
                         utils::CancellationToken& cancel);
  ClientFactory make_redis_factory() const;
  DatabaseHandle& handle(const std::string& db_name);
  const DatabaseHandle& handle(const std::string& db_name) const;
};

} // namespace db
} // namespace cfgdb

#endif // CFGDB_DB_CONNECTION_REGISTRY_HPP
