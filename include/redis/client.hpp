#ifndef CFGDB_REDIS_CLIENT_HPP
#define CFGDB_REDIS_CLIENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "redis/resp_codec.hpp"
#include "redis/subscription.hpp"

namespace cfgdb {
namespace redis {

// Flat string hash as stored: field -> value
using Hash = std::map<std::string, std::string>;

// Command seam between the table layer and the store. Implementations provide
// raw command execution; the typed helpers below are shared.
class Client {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~Client() = default;


  // ---- RAW COMMAND EXECUTION ----
  // Runs one command. Error replies are returned, not thrown.
  virtual Reply command(const Command& command) = 0;
  // Runs a batch of commands in a single round trip, one reply per command
  virtual std::vector<Reply> pipeline(const std::vector<Command>& commands) = 0;
  // Opens a new notification channel to the same store instance
  virtual std::unique_ptr<Subscription> make_subscription() = 0;

  virtual void close() = 0;
  virtual bool is_connected() const = 0;


  // ---- HASH COMMANDS ----
  std::optional<std::string> hget(const std::string& key, const std::string& field);
  Hash hgetall(const std::string& key);
  // HSET with several field/value pairs. An empty hash is a no-op.
  long long hset(const std::string& key, const Hash& fields);
  long long hdel(const std::string& key, const std::vector<std::string>& fields);


  // ---- KEY COMMANDS ----
  long long del(const std::string& key);
  long long del(const std::vector<std::string>& keys);
  std::vector<std::string> keys(const std::string& pattern);
  // One SCAN step. Returns the next cursor (0 when done) and the keys of this batch.
  std::pair<std::uint64_t, std::vector<std::string>> scan(std::uint64_t cursor,
                                                          const std::string& pattern,
                                                          std::size_t count);
  bool expire(const std::string& key, long long seconds);
  bool exists(const std::string& key);
  std::optional<std::string> get(const std::string& key);


  // ---- SERVER COMMANDS ----
  long long publish(const std::string& channel, const std::string& message);
  void config_set(const std::string& parameter, const std::string& value);
  void ping();


  // ---- REPLY DECODING ----
  // Throws SchemaError if reply is an error reply
  static const Reply& check(const Reply& reply, const Command& command);
  // Decodes a flat HGETALL field/value array
  static Hash to_hash(const Reply& reply);
  static std::vector<std::string> to_strings(const Reply& reply);

protected:
  Client() = default;

private:
  Reply checked(const Command& command);
  static long long to_integer(const Reply& reply, const Command& command);
};

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_CLIENT_HPP
