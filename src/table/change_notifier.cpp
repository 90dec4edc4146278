#include "table/change_notifier.hpp"
#include <exception>
#include <vector>
#include <boost/log/trivial.hpp>
#include "table/type_codec.hpp"

namespace cfgdb {
namespace table {

std::ostream& operator<<(std::ostream& os, ChangeKind kind) {
  return os << (kind == ChangeKind::SET ? "SET" : "DELETE");
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChangeNotifier::ChangeNotifier(db::ConnectionRegistry& registry, const std::string& db_name)
  : registry_(registry)
  , db_name_(db_name)
  , key_codec_(registry.separator(db_name))
  , pattern_("__keyspace@" + std::to_string(registry.db_id(db_name)) + "__:*") {
  BOOST_LOG_TRIVIAL(debug) << "Change notifier: Created for '" << db_name_ << "' on " << pattern_;
}

ChangeNotifier::~ChangeNotifier() {
  stop();
  std::unique_lock<std::mutex> lock(mutex_);
  loop_exited_.wait(lock, [this] { return !listening_; });
}


//==============================================
// HANDLER REGISTRATION
//==============================================

HandlerId ChangeNotifier::subscribe(const std::string& table, ChangeHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HandlerId id = next_id_++;
  handlers_[KeyCodec::to_upper(table)].emplace(id, std::move(handler));
  BOOST_LOG_TRIVIAL(debug) << "Change notifier: Handler " << id << " registered for " << KeyCodec::to_upper(table);
  return id;
}

bool ChangeNotifier::unsubscribe(const std::string& table, HandlerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(KeyCodec::to_upper(table));
  if (it == handlers_.end() || it->second.erase(id) == 0) {
    return false;
  }
  if (it->second.empty()) {
    handlers_.erase(it);
  }
  return true;
}

void ChangeNotifier::unsubscribe(const std::string& table) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(KeyCodec::to_upper(table));
}

bool ChangeNotifier::has_handlers(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(KeyCodec::to_upper(table)) > 0;
}


//==============================================
// DISPATCH LOOP
//==============================================

void ChangeNotifier::listen(utils::CancellationToken& cancel) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listening_ = true;
  }
  LoopGuard guard(*this);
  BOOST_LOG_TRIVIAL(info) << "Change notifier: Listening on '" << db_name_ << "'";

  std::unique_ptr<redis::Subscription> channel;
  const auto poll = registry_.get_settings().notification_timeout;

  while (!stop_requested_ && !cancel.is_cancelled()) {
    try {
      if (!channel) {
        channel = open_subscription();
      }
      if (auto message = channel->get_message(poll)) {
        dispatch(*message);
      }
    } catch (const db::ConnectionError& e) {
      BOOST_LOG_TRIVIAL(error) << "Change notifier: " << e.what();
      recover(channel, cancel);
    } catch (const db::MissingClientError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Change notifier: " << e.what();
      recover(channel, cancel);
    } catch (const db::SchemaError& e) {
      // Rejected PSUBSCRIBE
      BOOST_LOG_TRIVIAL(error) << "Change notifier: " << e.what();
      recover(channel, cancel);
    }
  }

  if (channel) {
    try {
      channel->close();
    } catch (const db::ConnectionError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Change notifier: Close failed: " << e.what();
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Change notifier: Stopped listening on '" << db_name_ << "'";
}

void ChangeNotifier::stop() {
  stop_requested_ = true;
}

bool ChangeNotifier::dispatch(const redis::PubSubMessage& message) {
  auto colon = message.channel.find(':');
  if (colon == std::string::npos) {
    BOOST_LOG_TRIVIAL(debug) << "Change notifier: Ignoring channel " << message.channel;
    return false;
  }
  const std::string key = message.channel.substr(colon + 1);
  auto parts = key_codec_.split_table_key(key);
  if (!parts) {
    BOOST_LOG_TRIVIAL(debug) << "Change notifier: Ignoring key without table " << key;
    return false;
  }
  const std::string& table = parts->first;

  std::vector<ChangeHandler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(table);
    if (it == handlers_.end()) {
      return false;
    }
    for (const auto& [id, handler] : it->second) {
      targets.push_back(handler);
    }
  }

  std::shared_ptr<redis::Client> store = registry_.client(db_name_);
  Row row;
  ChangeKind kind = ChangeKind::DELETE;
  try {
    row = TypeCodec::raw_to_typed(store->hgetall(key));
    kind = store->exists(key) ? ChangeKind::SET : ChangeKind::DELETE;
  } catch (const db::SchemaError& e) {
    // Not a hash, e.g. a string key under a table prefix
    BOOST_LOG_TRIVIAL(warning) << "Change notifier: Ignoring " << key << ": " << e.what();
    return false;
  }
  RowKey row_key = key_codec_.deserialize_key(parts->second);

  BOOST_LOG_TRIVIAL(trace) << "Change notifier: " << message.data << " on " << key << " -> " << kind;
  for (const auto& handler : targets) {
    try {
      handler(table, row_key, row, kind);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Change notifier: Handler for " << table << " failed: " << e.what();
    }
  }
  return true;
}


//==============================================
// LOOP HELPERS
//==============================================

ChangeNotifier::LoopGuard::~LoopGuard() {
  // A stop() issued for this run is consumed here, not at the next start
  std::lock_guard<std::mutex> lock(notifier_.mutex_);
  notifier_.stop_requested_ = false;
  notifier_.listening_ = false;
  notifier_.loop_exited_.notify_all();
}

std::unique_ptr<redis::Subscription> ChangeNotifier::open_subscription() {
  std::unique_ptr<redis::Subscription> channel = registry_.client(db_name_)->make_subscription();
  channel->psubscribe(pattern_);
  return channel;
}

void ChangeNotifier::recover(std::unique_ptr<redis::Subscription>& channel, utils::CancellationToken& cancel) {
  channel.reset();
  if (!cancel.sleep_for(registry_.get_settings().connect_retry_wait)) {
    return;
  }
  if (!registry_.is_connected(db_name_)) {
    try {
      registry_.reconnect(db_name_, cancel);
    } catch (const db::CancelledError&) {
      BOOST_LOG_TRIVIAL(info) << "Change notifier: Reconnect of '" << db_name_ << "' cancelled";
    }
  }
}

} // namespace table
} // namespace cfgdb
