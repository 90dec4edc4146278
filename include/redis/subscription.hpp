#ifndef CFGDB_REDIS_SUBSCRIPTION_HPP
#define CFGDB_REDIS_SUBSCRIPTION_HPP

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "redis/connection.hpp"

namespace cfgdb {
namespace redis {

// A message delivered to a pattern subscriber, e.g.
// {pattern "__keyspace@4__:*", channel "__keyspace@4__:PORT|Ethernet0", data "hset"}
struct PubSubMessage {
  std::string pattern;
  std::string channel;
  std::string data;
};

// Notification channel on which keyspace events arrive
class Subscription {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~Subscription() = default;


  // ---- SUBSCRIPTION CONTROL ----
  virtual void psubscribe(const std::string& pattern) = 0;
  virtual void punsubscribe(const std::string& pattern) = 0;
  virtual void close() = 0;


  // ---- MESSAGE RECEPTION ----
  // Waits up to timeout for the next published message
  virtual std::optional<PubSubMessage> get_message(std::chrono::milliseconds timeout) = 0;

protected:
  Subscription() = default;
};

// Subscription over a dedicated store connection. A connection in subscribed
// mode cannot run regular commands, so it is never shared with a Client.
class RedisSubscription : public Subscription {
public:
  RedisSubscription(const Endpoint& endpoint,
                    std::chrono::milliseconds connect_timeout,
                    std::chrono::milliseconds command_timeout);
  ~RedisSubscription() override;

  void psubscribe(const std::string& pattern) override;
  void punsubscribe(const std::string& pattern) override;
  void close() override;

  std::optional<PubSubMessage> get_message(std::chrono::milliseconds timeout) override;

  const std::vector<std::string>& get_patterns() const { return patterns_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<Connection> connection_;
  std::chrono::milliseconds command_timeout_;
  std::vector<std::string> patterns_;
  // Messages that arrived while waiting for a (un)subscribe confirmation
  std::deque<PubSubMessage> pending_;


  // Sends a (un)subscribe command and reads until it is confirmed
  void send_and_confirm(const Command& command, const std::string& confirmation);
  // Converts a pmessage/message push into a PubSubMessage
  static std::optional<PubSubMessage> to_message(const Reply& reply);
};

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_SUBSCRIPTION_HPP
