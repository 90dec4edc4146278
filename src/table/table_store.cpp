#include "table/table_store.hpp"
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace table {

//==============================================
// CONSTRUCTOR
//==============================================

TableStore::TableStore(db::ConnectionRegistry& registry)
  : registry_(registry) {}


//==============================================
// CONNECTION
//==============================================

void TableStore::db_connect(const std::string& db_name, bool wait_for_init, bool retry_on,
                            utils::CancellationToken& cancel) {
  db_name_ = db_name;
  registry_.connect(registry_.db_id(db_name_), db_name_, retry_on, cancel);
  key_codec_ = KeyCodec(registry_.separator(db_name_));
  BOOST_LOG_TRIVIAL(info) << "Table store: Attached to '" << db_name_ << "' with separator '"
                          << key_codec_.get_separator() << "'";

  if (wait_for_init) {
    wait_for_db_init(cancel);
  }
}

void TableStore::connect(bool wait_for_init, bool retry_on, utils::CancellationToken& cancel) {
  db_connect(CONFIG_DB, wait_for_init, retry_on, cancel);
}

void TableStore::wait_for_db_init(utils::CancellationToken& cancel) {
  std::shared_ptr<redis::Client> store = client();
  if (store->get(INIT_INDICATOR)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Table store: Waiting for '" << db_name_ << "' to be initialized";
  const std::string pattern = "__keyspace@" + std::to_string(registry_.db_id(db_name_)) + "__:" + INIT_INDICATOR;
  std::unique_ptr<redis::Subscription> channel = store->make_subscription();
  channel->psubscribe(pattern);

  // Checked again after subscribing so a write in between is not missed
  while (!store->get(INIT_INDICATOR)) {
    cancel.throw_if_cancelled("wait for " + std::string(INIT_INDICATOR));
    channel->get_message(registry_.get_settings().notification_timeout);
  }

  channel->punsubscribe(pattern);
  channel->close();
  BOOST_LOG_TRIVIAL(info) << "Table store: '" << db_name_ << "' is initialized";
}


//==============================================
// ENTRY OPERATIONS
//==============================================

Row TableStore::get_entry(const std::string& table, const RowKey& key) {
  return TypeCodec::raw_to_typed(client()->hgetall(key_codec_.table_key(table, key)));
}

void TableStore::set_entry(const std::string& table, const RowKey& key, const std::optional<Row>& data) {
  std::shared_ptr<redis::Client> store = client();
  const std::string hash = key_codec_.table_key(table, key);

  if (!data) {
    store->del(hash);
    return;
  }

  Row current = get_entry(table, key);
  store->hset(hash, TypeCodec::typed_to_raw(*data));

  std::vector<std::string> stale;
  for (const auto& [field, value] : current) {
    if (data->count(field) == 0) {
      stale.push_back(TypeCodec::raw_field_name(field, value));
    }
  }
  store->hdel(hash, stale);
}

void TableStore::mod_entry(const std::string& table, const RowKey& key, const std::optional<Row>& data) {
  std::shared_ptr<redis::Client> store = client();
  const std::string hash = key_codec_.table_key(table, key);

  if (!data) {
    store->del(hash);
  } else {
    store->hset(hash, TypeCodec::typed_to_raw(*data));
  }
}

std::vector<RowKey> TableStore::get_keys(const std::string& table, bool split) {
  std::vector<RowKey> result;
  for (const auto& key : client()->keys(key_codec_.table_pattern(table))) {
    if (!split) {
      result.push_back(key_codec_.deserialize_key(key));
      continue;
    }
    if (auto parts = key_codec_.split_table_key(key)) {
      result.push_back(key_codec_.deserialize_key(parts->second));
    }
  }
  return result;
}


//==============================================
// TABLE OPERATIONS
//==============================================

Table TableStore::get_table(const std::string& table) {
  std::shared_ptr<redis::Client> store = client();
  Table data;

  for (const auto& key : store->keys(key_codec_.table_pattern(table))) {
    auto parts = key_codec_.split_table_key(key);
    if (!parts) {
      continue;
    }
    redis::Hash raw = store->hgetall(key);
    if (!raw.empty()) {
      data[key_codec_.deserialize_key(parts->second)] = TypeCodec::raw_to_typed(raw);
    }
  }
  return data;
}

void TableStore::delete_table(const std::string& table) {
  std::shared_ptr<redis::Client> store = client();
  for (const auto& key : store->keys(key_codec_.table_pattern(table))) {
    store->del(key);
  }
}


//==============================================
// SNAPSHOT OPERATIONS
//==============================================

void TableStore::mod_config(const SnapshotPatch& data) {
  for (const auto& [table_name, table_data] : data) {
    if (!table_data) {
      delete_table(table_name);
      continue;
    }
    for (const auto& [key, row] : *table_data) {
      mod_entry(table_name, key, row);
    }
  }
}

Snapshot TableStore::get_config() {
  std::shared_ptr<redis::Client> store = client();
  Snapshot data;

  for (const auto& key : store->keys("*")) {
    // Non-table keys such as the init indicator are not hashes
    if (!key_codec_.split_table_key(key)) {
      continue;
    }
    add_to_snapshot(data, key, store->hgetall(key));
  }
  return data;
}


//==============================================
// HELPERS
//==============================================

std::shared_ptr<redis::Client> TableStore::client() const {
  return registry_.client(db_name_);
}

bool TableStore::add_to_snapshot(Snapshot& data, const std::string& key, const redis::Hash& raw) const {
  auto parts = key_codec_.split_table_key(key);
  if (!parts) {
    return false;
  }
  // A key deleted between enumeration and read comes back empty
  if (!raw.empty()) {
    data[parts->first][key_codec_.deserialize_key(parts->second)] = TypeCodec::raw_to_typed(raw);
  }
  return true;
}

} // namespace table
} // namespace cfgdb
