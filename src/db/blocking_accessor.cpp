#include "db/blocking_accessor.hpp"
#include <algorithm>

namespace cfgdb {
namespace db {

namespace {

// Value written by producers that have nothing to store
const char* const NONE_VALUE = "None";

} // namespace

RetryPolicy RetryPolicy::from_settings(const config::ConnectorSettings& settings, bool blocking) {
  RetryPolicy policy;
  policy.blocking = blocking;
  policy.connect_retry_wait = settings.connect_retry_wait;
  policy.data_retrieval_wait = settings.data_retrieval_wait;
  policy.notification_timeout = settings.notification_timeout;
  policy.maximum_data_wait = settings.maximum_data_wait;
  policy.error_threshold = settings.error_threshold;
  policy.error_suppression = settings.error_suppression;
  return policy;
}

bool AwaitedChange::matches(const redis::PubSubMessage& message) const {
  if (key.empty() && event.empty()) {
    return false;
  }
  if (!key.empty()) {
    // Keyspace channels look like "__keyspace@<db>__:<key>"
    std::size_t colon = message.channel.find(':');
    if (colon == std::string::npos || message.channel.compare(colon + 1, std::string::npos, key) != 0) {
      return false;
    }
  }
  return event.empty() || message.data == event;
}

std::string AwaitedChange::describe() const {
  if (!key.empty()) {
    return "'" + key + "'";
  }
  return event.empty() ? "data" : "'" + event + "' event";
}


//==============================================
// CONSTRUCTOR
//==============================================

BlockingAccessor::BlockingAccessor(ConnectionRegistry& registry, utils::CancellationToken& cancel)
  : registry_(registry)
  , cancel_(cancel) {}

RetryPolicy BlockingAccessor::policy(bool blocking) const {
  return RetryPolicy::from_settings(registry_.get_settings(), blocking);
}


//==============================================
// READ ACCESSORS
//==============================================

ReadResult<std::vector<std::string>> BlockingAccessor::keys(const std::string& db_name,
                                                            const std::string& pattern,
                                                            const RetryPolicy& policy) {
  // An empty database fills up through HSETs
  AwaitedChange awaited{"", "hset"};
  Attempt<std::vector<std::string>> attempt =
    [&pattern](redis::Client& client) -> std::optional<std::vector<std::string>> {
      std::vector<std::string> found = client.keys(pattern);
      if (found.empty()) {
        return std::nullopt;
      }
      return found;
    };
  return execute(db_name, "keys", awaited, policy, attempt);
}

ReadResult<std::optional<std::string>> BlockingAccessor::get(const std::string& db_name,
                                                             const std::string& hash,
                                                             const std::string& field,
                                                             const RetryPolicy& policy) {
  AwaitedChange awaited{hash, ""};
  Attempt<std::optional<std::string>> attempt =
    [&hash, &field](redis::Client& client) -> std::optional<std::optional<std::string>> {
      std::optional<std::string> value = client.hget(hash, field);
      if (!value || value->empty()) {
        return std::nullopt;
      }
      if (*value == NONE_VALUE) {
        return std::optional<std::string>();
      }
      return value;
    };
  return execute(db_name, "get", awaited, policy, attempt);
}

ReadResult<redis::Hash> BlockingAccessor::get_all(const std::string& db_name,
                                                  const std::string& hash,
                                                  const RetryPolicy& policy) {
  AwaitedChange awaited{hash, ""};
  Attempt<redis::Hash> attempt = [&hash](redis::Client& client) -> std::optional<redis::Hash> {
    redis::Hash table = client.hgetall(hash);
    if (table.empty()) {
      return std::nullopt;
    }
    for (auto& entry : table) {
      if (entry.second == NONE_VALUE) {
        entry.second.clear();
      }
    }
    return table;
  };
  return execute(db_name, "get_all", awaited, policy, attempt);
}


//==============================================
// WRITE ACCESSORS
//==============================================

long long BlockingAccessor::set(const std::string& db_name, const std::string& hash,
                                const std::string& field, const std::string& value,
                                const RetryPolicy& policy) {
  return execute_write<long long>(db_name, "set", policy,
    [&](redis::Client& client) { return client.hset(hash, {{field, value}}); });
}

long long BlockingAccessor::del(const std::string& db_name, const std::string& key,
                                const RetryPolicy& policy) {
  return execute_write<long long>(db_name, "delete", policy,
    [&](redis::Client& client) { return client.del(key); });
}

long long BlockingAccessor::delete_all_by_pattern(const std::string& db_name, const std::string& pattern,
                                                  const RetryPolicy& policy) {
  return execute_write<long long>(db_name, "delete_all_by_pattern", policy,
    [&](redis::Client& client) {
      long long removed = 0;
      for (const auto& key : client.keys(pattern)) {
        removed += client.del(key);
      }
      return removed;
    });
}


//==============================================
// DIRECT ACCESSORS
//==============================================

long long BlockingAccessor::publish(const std::string& db_name, const std::string& channel,
                                    const std::string& message) {
  return registry_.client(db_name)->publish(channel, message);
}

bool BlockingAccessor::expire(const std::string& db_name, const std::string& key, long long seconds) {
  return registry_.client(db_name)->expire(key, seconds);
}

bool BlockingAccessor::exists(const std::string& db_name, const std::string& key) {
  return registry_.client(db_name)->exists(key);
}


//==============================================
// STATE HANDLERS
//==============================================

bool BlockingAccessor::wait_for_change(const std::string& db_name, const AwaitedChange& awaited,
                                       const RetryPolicy& policy) {
  BOOST_LOG_TRIVIAL(debug) << "Blocking accessor: Listening on pubsub channel '" << db_name << "'";

  const auto start = std::chrono::steady_clock::now();
  while (true) {
    cancel_.throw_if_cancelled("wait for " + awaited.describe());

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    if (elapsed >= policy.maximum_data_wait) {
      break;
    }
    auto poll = std::min(policy.notification_timeout, policy.maximum_data_wait - elapsed);

    std::optional<redis::PubSubMessage> message = registry_.subscription(db_name).get_message(poll);
    if (message && awaited.matches(*message)) {
      BOOST_LOG_TRIVIAL(info) << "Blocking accessor: " << awaited.describe()
                              << " acquired via pub-sub on '" << db_name << "'. Unblocking...";
      // Let the writer finish the rest of its update before reading
      if (!cancel_.sleep_for(policy.data_retrieval_wait)) {
        throw CancelledError("wait for " + awaited.describe());
      }
      return true;
    }
  }

  BOOST_LOG_TRIVIAL(warning) << "Blocking accessor: No notification for " << awaited.describe()
                             << " from '" << db_name << "' received before timeout";
  return false;
}

void BlockingAccessor::handle_connection_error(const std::string& db_name, const std::string& operation,
                                               int attempts, const RetryPolicy& policy,
                                               const ConnectionError& error) {
  // Repeated failures mean the database itself is unhealthy; past the
  // suppression point drop back to warnings so the log is not flooded
  if (policy.error_threshold < attempts && attempts < policy.error_suppression) {
    BOOST_LOG_TRIVIAL(error) << "Blocking accessor: DB access failure by [" << db_name << ":" << operation
                             << "] attempt " << attempts << ": " << error.what();
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Blocking accessor: DB access failure by [" << db_name << ":" << operation
                               << "] attempt " << attempts << ": " << error.what();
  }

  BOOST_LOG_TRIVIAL(warning) << "Blocking accessor: Could not reach '" << db_name
                             << "', waiting before trying again";
  registry_.close(db_name);
  if (!cancel_.sleep_for(policy.connect_retry_wait)) {
    throw CancelledError(operation + " on '" + db_name + "'");
  }
  registry_.reconnect(db_name, cancel_);
}

} // namespace db
} // namespace cfgdb
