#include "db/connection_registry.hpp"
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "redis/redis_client.hpp"

namespace cfgdb {
namespace db {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionRegistry::ConnectionRegistry(config::DatabaseConfig catalogue,
                                       config::ConnectorSettings settings)
  : catalogue_(std::move(catalogue))
  , settings_(std::move(settings)) {
  factory_ = make_redis_factory();
}

ConnectionRegistry::ConnectionRegistry(config::DatabaseConfig catalogue,
                                       config::ConnectorSettings settings,
                                       ClientFactory factory)
  : catalogue_(std::move(catalogue))
  , settings_(std::move(settings))
  , factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("Connection registry: Client factory must not be empty");
  }
}

ConnectionRegistry::~ConnectionRegistry() {
  close_all();
}

ClientFactory ConnectionRegistry::make_redis_factory() const {
  config::DatabaseConfig catalogue = catalogue_;
  config::ConnectorSettings settings = settings_;

  return [catalogue, settings](const std::string& db_name, int db_id) -> std::shared_ptr<redis::Client> {
    redis::ClientOptions options;
    if (catalogue.has_database(db_name)) {
      options.endpoint = catalogue.endpoint(db_name, settings.use_unix_socket);
    }
    options.db_id = db_id;
    options.connect_timeout = settings.connect_timeout;
    options.command_timeout = settings.command_timeout;
    options.keyspace_events = settings.keyspace_events;
    return redis::RedisClient::open(options);
  };
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

void ConnectionRegistry::connect(int db_id, const std::string& db_name, bool retry_forever,
                                 utils::CancellationToken& cancel) {
  if (retry_forever) {
    persistent_connect(db_id, db_name, cancel);
  } else {
    onetime_connect(db_id, db_name);
  }
}

void ConnectionRegistry::connect(const std::string& db_name, bool retry_forever,
                                 utils::CancellationToken& cancel) {
  connect(catalogue_.db_id(db_name), db_name, retry_forever, cancel);
}

void ConnectionRegistry::onetime_connect(int db_id, const std::string& db_name) {
  if (db_id < 0) {
    throw std::invalid_argument("Connection registry: Invalid database id for '" + db_name + "'");
  }
  if (db_name.empty()) {
    throw std::invalid_argument("Connection registry: No database name configured");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handles_.count(db_name) > 0) {
      return;
    }
    db_ids_[db_name] = db_id;
  }

  std::shared_ptr<redis::Client> client = factory_(db_name, db_id);
  if (!client) {
    throw ConnectionError("No client created for '" + db_name + "'");
  }

  DatabaseHandle entry;
  entry.name = db_name;
  entry.id = db_id;
  entry.separator = catalogue_.has_database(db_name) ? catalogue_.separator(db_name)
                                                     : settings_.default_separator;
  entry.client = client;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!handles_.emplace(db_name, std::move(entry)).second) {
    // Another thread registered the name first; keep the existing client
    client->close();
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Connection registry: Connected '" << db_name << "' (db " << db_id << ")";
}

void ConnectionRegistry::persistent_connect(int db_id, const std::string& db_name,
                                            utils::CancellationToken& cancel) {
  while (true) {
    cancel.throw_if_cancelled("connect to '" + db_name + "'");
    try {
      onetime_connect(db_id, db_name);
      return;
    } catch (const ConnectionError& e) {
      wait_before_retry(db_id, db_name, e, cancel);
    } catch (const SchemaError& e) {
      // SELECT or CONFIG SET rejected while setting up the client
      wait_before_retry(db_id, db_name, e, cancel);
    }
  }
}

void ConnectionRegistry::wait_before_retry(int db_id, const std::string& db_name, const DbError& error,
                                           utils::CancellationToken& cancel) {
  BOOST_LOG_TRIVIAL(warning) << "Connection registry: Connecting to DB '" << db_id << " " << db_name
                             << "' failed, will retry in " << settings_.connect_retry_wait.count()
                             << "ms: " << error.what();
  close(db_name);
  if (!cancel.sleep_for(settings_.connect_retry_wait)) {
    throw CancelledError("connect to '" + db_name + "'");
  }
}

void ConnectionRegistry::close(const std::string& db_name) {
  DatabaseHandle removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(db_name);
    if (it == handles_.end()) {
      return;
    }
    removed = std::move(it->second);
    handles_.erase(it);
  }

  if (removed.notifications) {
    removed.notifications->close();
  }
  if (removed.client) {
    removed.client->close();
  }
  BOOST_LOG_TRIVIAL(info) << "Connection registry: Closed '" << db_name << "'";
}

void ConnectionRegistry::close_all() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : handles_) {
      names.push_back(entry.first);
    }
  }
  for (const auto& name : names) {
    close(name);
  }
}

void ConnectionRegistry::reconnect(const std::string& db_name, utils::CancellationToken& cancel) {
  int db_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = db_ids_.find(db_name);
    if (it == db_ids_.end()) {
      throw MissingClientError(db_name);
    }
    db_id = it->second;
  }

  BOOST_LOG_TRIVIAL(debug) << "Connection registry: Reconnecting '" << db_name << "'";
  close(db_name);
  persistent_connect(db_id, db_name, cancel);
}


//==============================================
// CLIENT LOOKUP
//==============================================

std::shared_ptr<redis::Client> ConnectionRegistry::client(const std::string& db_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle(db_name).client;
}

bool ConnectionRegistry::is_registered(const std::string& db_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.count(db_name) > 0;
}

bool ConnectionRegistry::is_connected(const std::string& db_name) const {
  std::shared_ptr<redis::Client> current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(db_name);
    if (it == handles_.end()) {
      return false;
    }
    current = it->second.client;
  }
  return current && current->is_connected();
}

int ConnectionRegistry::db_id(const std::string& db_name) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = db_ids_.find(db_name);
    if (it != db_ids_.end()) {
      return it->second;
    }
  }
  if (catalogue_.has_database(db_name)) {
    return catalogue_.db_id(db_name);
  }
  throw MissingClientError(db_name);
}

char ConnectionRegistry::separator(const std::string& db_name) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(db_name);
    if (it != handles_.end()) {
      return it->second.separator;
    }
  }
  return catalogue_.has_database(db_name) ? catalogue_.separator(db_name)
                                          : settings_.default_separator;
}


//==============================================
// KEYSPACE NOTIFICATIONS
//==============================================

void ConnectionRegistry::subscribe_keyspace(const std::string& db_name) {
  BOOST_LOG_TRIVIAL(debug) << "Connection registry: Subscribe to keyspace notification on '" << db_name << "'";

  std::unique_ptr<redis::Subscription> channel = client(db_name)->make_subscription();
  channel->psubscribe(settings_.keyspace_pattern);

  std::unique_ptr<redis::Subscription> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    DatabaseHandle& entry = handle(db_name);
    previous = std::move(entry.notifications);
    entry.notifications = std::move(channel);
  }
  if (previous) {
    previous->close();
  }
}

void ConnectionRegistry::unsubscribe_keyspace(const std::string& db_name) {
  std::unique_ptr<redis::Subscription> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(db_name);
    if (it == handles_.end() || !it->second.notifications) {
      return;
    }
    channel = std::move(it->second.notifications);
  }

  BOOST_LOG_TRIVIAL(debug) << "Connection registry: Unsubscribe from keyspace notification on '" << db_name << "'";
  channel->close();
}

bool ConnectionRegistry::has_subscription(const std::string& db_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handles_.find(db_name);
  return it != handles_.end() && it->second.notifications != nullptr;
}

redis::Subscription& ConnectionRegistry::subscription(const std::string& db_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  DatabaseHandle& entry = handle(db_name);
  if (!entry.notifications) {
    throw MissingClientError(db_name + " keyspace channel");
  }
  return *entry.notifications;
}

DatabaseHandle& ConnectionRegistry::handle(const std::string& db_name) {
  auto it = handles_.find(db_name);
  if (it == handles_.end()) {
    throw MissingClientError(db_name);
  }
  return it->second;
}

const DatabaseHandle& ConnectionRegistry::handle(const std::string& db_name) const {
  auto it = handles_.find(db_name);
  if (it == handles_.end()) {
    throw MissingClientError(db_name);
  }
  return it->second;
}

} // namespace db
} // namespace cfgdb
