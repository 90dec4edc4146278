#include "redis/redis_client.hpp"
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace redis {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RedisClient::RedisClient(ClientOptions options)
  : options_(std::move(options))
  , connection_(std::make_unique<Connection>()) {}

RedisClient::~RedisClient() {
  close();
}

std::shared_ptr<RedisClient> RedisClient::open(const ClientOptions& options) {
  auto client = std::make_shared<RedisClient>(options);
  client->connect();
  return client;
}


//==============================================
// CONNECTION CONTROL
//==============================================

void RedisClient::connect() {
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    connection_->connect(options_.endpoint, options_.connect_timeout);
  }

  if (options_.db_id != 0) {
    check(command({"SELECT", std::to_string(options_.db_id)}), {"SELECT"});
  }

  // Keyspace notifications are off by default on the server
  if (!options_.keyspace_events.empty()) {
    config_set("notify-keyspace-events", options_.keyspace_events);
  }

  BOOST_LOG_TRIVIAL(info) << "Redis client: Connected to " << options_.endpoint.to_string()
                          << " db " << options_.db_id;
}

void RedisClient::close() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (connection_) {
    connection_->close();
  }
}

bool RedisClient::is_connected() const {
  std::lock_guard<std::mutex> lock(io_mutex_);
  return connection_ && connection_->is_connected();
}


//==============================================
// COMMAND EXECUTION
//==============================================

Reply RedisClient::command(const Command& command) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  return connection_->execute(command, options_.command_timeout);
}

std::vector<Reply> RedisClient::pipeline(const std::vector<Command>& commands) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  return connection_->execute_pipeline(commands, options_.command_timeout);
}

std::unique_ptr<Subscription> RedisClient::make_subscription() {
  return std::make_unique<RedisSubscription>(options_.endpoint,
                                             options_.connect_timeout,
                                             options_.command_timeout);
}

} // namespace redis
} // namespace cfgdb
