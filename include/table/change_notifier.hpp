#ifndef CFGDB_TABLE_CHANGE_NOTIFIER_HPP
#define CFGDB_TABLE_CHANGE_NOTIFIER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include "db/connection_registry.hpp"
#include "redis/subscription.hpp"
#include "table/key_codec.hpp"
#include "table/types.hpp"
#include "utils/cancellation.hpp"

namespace cfgdb {
namespace table {

enum class ChangeKind {
  SET,
  DELETE
};

std::ostream& operator<<(std::ostream& os, ChangeKind kind);

// Called with (table, row key, current row, kind). The row is empty for DELETE.
using ChangeHandler = std::function<void(const std::string&, const RowKey&, const Row&, ChangeKind)>;
using HandlerId = std::uint64_t;

// Listens to keyspace events of one database and hands changed rows to the
// handlers registered for their table.
//
// The change kind comes from an EXISTS check made after the event arrives. The
// key can be re-created or deleted in between, so the kind is best-effort.
class ChangeNotifier {
public:
  ChangeNotifier(const ChangeNotifier&) = delete;
  ChangeNotifier& operator=(const ChangeNotifier&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // db_name must already be connected through the registry
  ChangeNotifier(db::ConnectionRegistry& registry, const std::string& db_name);
  // Stops a running listen() and waits for it to return. Must not be called
  // from a handler.
  ~ChangeNotifier();


  // ---- HANDLER REGISTRATION ----
  HandlerId subscribe(const std::string& table, ChangeHandler handler);
  // Returns false if the handler was not registered
  bool unsubscribe(const std::string& table, HandlerId id);
  void unsubscribe(const std::string& table);
  bool has_handlers(const std::string& table) const;


  // ---- DISPATCH LOOP ----
  // Blocks until stop() or cancellation. A stop() made before the loop starts
  // makes it return at once. Entries that are not hashes are skipped.
  void listen(utils::CancellationToken& cancel = utils::CancellationToken::none());
  void stop();
  bool is_listening() const { return listening_.load(); }

  // Handles one keyspace message. Returns false if it was ignored.
  bool dispatch(const redis::PubSubMessage& message);

private:
  // ---- PARAMETERS ----
  db::ConnectionRegistry& registry_;
  std::string db_name_;
  KeyCodec key_codec_;
  std::string pattern_;

  std::map<std::string, std::map<HandlerId, ChangeHandler>> handlers_;
  HandlerId next_id_{1};
  mutable std::mutex mutex_;

  std::atomic<bool> listening_{false};
  std::atomic<bool> stop_requested_{false};
  std::condition_variable loop_exited_;

  // Marks the loop as finished on every exit path
  class LoopGuard {
  public:
    explicit LoopGuard(ChangeNotifier& notifier) : notifier_(notifier) {}
    ~LoopGuard();

  private:
    ChangeNotifier& notifier_;
  };


  // ---- LOOP HELPERS ----
  std::unique_ptr<redis::Subscription> open_subscription();
  void recover(std::unique_ptr<redis::Subscription>& channel, utils::CancellationToken& cancel);
};

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_CHANGE_NOTIFIER_HPP
