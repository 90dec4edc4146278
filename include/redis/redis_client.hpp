#ifndef CFGDB_REDIS_REDIS_CLIENT_HPP
#define CFGDB_REDIS_REDIS_CLIENT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "redis/client.hpp"
#include "redis/connection.hpp"

namespace cfgdb {
namespace redis {

struct ClientOptions {
  Endpoint endpoint;
  int db_id{0};
  std::chrono::milliseconds connect_timeout{2000};
  std::chrono::milliseconds command_timeout{5000};
  // Value for notify-keyspace-events. Empty leaves the server setting alone.
  std::string keyspace_events{"KEA"};
};

// Client over a single store connection. Commands from several threads are
// serialised on io_mutex_.
class RedisClient : public Client {
public:
  RedisClient(const RedisClient&) = delete;
  RedisClient& operator=(const RedisClient&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit RedisClient(ClientOptions options);
  ~RedisClient() override;

  // Connects, selects the database and enables keyspace notifications
  static std::shared_ptr<RedisClient> open(const ClientOptions& options);


  // ---- CONNECTION CONTROL ----
  void connect();
  void close() override;
  bool is_connected() const override;


  // ---- COMMAND EXECUTION ----
  Reply command(const Command& command) override;
  std::vector<Reply> pipeline(const std::vector<Command>& commands) override;
  std::unique_ptr<Subscription> make_subscription() override;


  // ---- GETTERS ----
  const ClientOptions& get_options() const { return options_; }

private:
  // ---- PARAMETERS ----
  ClientOptions options_;
  std::unique_ptr<Connection> connection_;
  mutable std::mutex io_mutex_;
};

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_REDIS_CLIENT_HPP
