#ifndef CFGDB_DB_BLOCKING_ACCESSOR_HPP
#define CFGDB_DB_BLOCKING_ACCESSOR_HPP

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include "config/connector_settings.hpp"
#include "db/connection_registry.hpp"
#include "db/db_error.hpp"
#include "db/read_result.hpp"
#include "redis/client.hpp"
#include "utils/cancellation.hpp"

namespace cfgdb {
namespace db {

// How a single access is retried
struct RetryPolicy {
  // Wait for missing data to appear instead of returning unavailable
  bool blocking{false};
  // Reconnect and retry on connection errors; otherwise they propagate
  bool retry_on_connection_error{true};

  std::chrono::milliseconds connect_retry_wait{std::chrono::seconds(10)};
  std::chrono::milliseconds data_retrieval_wait{std::chrono::seconds(3)};
  std::chrono::milliseconds notification_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds maximum_data_wait{std::chrono::seconds(60)};
  int error_threshold{10};
  int error_suppression{15};

  static RetryPolicy from_settings(const config::ConnectorSettings& settings, bool blocking);
};

// The change notification a blocking read is waiting for. Matches on the
// changed key, on the event name, or both when both are set.
struct AwaitedChange {
  std::string key;
  std::string event;

  bool matches(const redis::PubSubMessage& message) const;
  std::string describe() const;
};

// Turns primitive store reads into retrying, notification-aware reads.
//
//   ATTEMPT -> SUCCESS       return data, drop any notification channel
//           -> SCHEMA_ERROR  rethrow, never retried
//           -> UNAVAILABLE   non-blocking: return unavailable
//                            blocking: subscribe and retry once, then wait for
//                            a matching notification up to maximum_data_wait
//           -> CONN_ERROR    close, back off, reconnect, retry
class BlockingAccessor {
public:
  // An attempt returns nullopt when the data is not there (yet)
  template <typename T>
  using Attempt = std::function<std::optional<T>(redis::Client&)>;


  // ---- CONSTRUCTOR ----
  explicit BlockingAccessor(ConnectionRegistry& registry,
                            utils::CancellationToken& cancel = utils::CancellationToken::none());


  // ---- POLICY EXECUTION ----
  template <typename T>
  ReadResult<T> execute(const std::string& db_name, const std::string& operation,
                        const AwaitedChange& awaited, const RetryPolicy& policy,
                        const Attempt<T>& attempt);


  // ---- READ ACCESSORS ----
  // An empty key list counts as unavailable
  ReadResult<std::vector<std::string>> keys(const std::string& db_name, const std::string& pattern,
                                            const RetryPolicy& policy);
  // The stored string "None" reads back as an empty optional
  ReadResult<std::optional<std::string>> get(const std::string& db_name, const std::string& hash,
                                             const std::string& field, const RetryPolicy& policy);
  ReadResult<redis::Hash> get_all(const std::string& db_name, const std::string& hash,
                                  const RetryPolicy& policy);


  // ---- WRITE ACCESSORS ----
  // Retried on connection errors only
  long long set(const std::string& db_name, const std::string& hash, const std::string& field,
                const std::string& value, const RetryPolicy& policy);
  long long del(const std::string& db_name, const std::string& key, const RetryPolicy& policy);
  long long delete_all_by_pattern(const std::string& db_name, const std::string& pattern,
                                  const RetryPolicy& policy);


  // ---- DIRECT ACCESSORS ----
  long long publish(const std::string& db_name, const std::string& channel, const std::string& message);
  bool expire(const std::string& db_name, const std::string& key, long long seconds);
  bool exists(const std::string& db_name, const std::string& key);

  // Policy built from the registry's settings
  RetryPolicy policy(bool blocking) const;

private:
  // ---- PARAMETERS ----
  ConnectionRegistry& registry_;
  utils::CancellationToken& cancel_;


  // ---- STATE HANDLERS ----
  // Waits on the open channel. Returns true once a matching notification arrived.
  bool wait_for_change(const std::string& db_name, const AwaitedChange& awaited,
                       const RetryPolicy& policy);
  void handle_connection_error(const std::string& db_name, const std::string& operation,
                               int attempts, const RetryPolicy& policy, const ConnectionError& error);

  // Writes always produce a value, so they only ever loop on connection errors
  template <typename T>
  T execute_write(const std::string& db_name, const std::string& operation,
                  const RetryPolicy& policy, const std::function<T(redis::Client&)>& write);
};


//==============================================
// TEMPLATE IMPLEMENTATION
//==============================================

template <typename T>
ReadResult<T> BlockingAccessor::execute(const std::string& db_name, const std::string& operation,
                                        const AwaitedChange& awaited, const RetryPolicy& policy,
                                        const Attempt<T>& attempt) {
  int attempts = 0;
  while (true) {
    cancel_.throw_if_cancelled(operation + " on '" + db_name + "'");

    try {
      std::shared_ptr<redis::Client> client = registry_.client(db_name);
      std::optional<T> data = attempt(*client);

      if (data) {
        registry_.unsubscribe_keyspace(db_name);
        return ReadResult<T>::available(std::move(*data));
      }

      std::string reason = operation + ": " + awaited.describe() + " unavailable in database '" + db_name + "'";
      if (!policy.blocking) {
        return ReadResult<T>::unavailable(reason);
      }

      BOOST_LOG_TRIVIAL(warning) << "Blocking accessor: " << reason;
      if (!registry_.has_subscription(db_name)) {
        // Subscribe first, then look again, so a write landing in between is not missed
        registry_.subscribe_keyspace(db_name);
        continue;
      }

      if (wait_for_change(db_name, awaited, policy)) {
        continue;
      }

      registry_.unsubscribe_keyspace(db_name);
      return ReadResult<T>::unavailable(reason);
    } catch (const SchemaError& e) {
      BOOST_LOG_TRIVIAL(error) << "Blocking accessor: Bad DB request [" << db_name << ":" << operation
                               << "]: " << e.what();
      throw;
    } catch (const ConnectionError& e) {
      if (!policy.retry_on_connection_error) {
        throw;
      }
      ++attempts;
      handle_connection_error(db_name, operation, attempts, policy, e);
    }
  }
}

template <typename T>
T BlockingAccessor::execute_write(const std::string& db_name, const std::string& operation,
                                  const RetryPolicy& policy, const std::function<T(redis::Client&)>& write) {
  RetryPolicy write_policy = policy;
  write_policy.blocking = false;

  Attempt<T> attempt = [&write](redis::Client& client) -> std::optional<T> {
    return write(client);
  };
  return execute<T>(db_name, operation, AwaitedChange{}, write_policy, attempt).value();
}

} // namespace db
} // namespace cfgdb

#endif // CFGDB_DB_BLOCKING_ACCESSOR_HPP
