#include "table/pipelined_table_store.hpp"
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace table {

PipelinedTableStore::PipelinedTableStore(db::ConnectionRegistry& registry)
  : TableStore(registry)
  , batch_size_(registry.get_settings().scan_batch_size) {}


//==============================================
// TABLE OPERATIONS
//==============================================

Table PipelinedTableStore::get_table(const std::string& table) {
  std::shared_ptr<redis::Client> store = client();
  Table data;

  scan_all(*store, key_codec_.table_pattern(table), [&](const std::vector<std::string>& keys) {
    std::vector<std::string> rows;
    std::vector<redis::Command> pipe;
    for (const auto& key : keys) {
      if (auto parts = key_codec_.split_table_key(key)) {
        rows.push_back(parts->second);
        pipe.push_back({"HGETALL", key});
      }
    }

    std::vector<redis::Reply> replies = execute(*store, pipe);
    for (std::size_t i = 0; i < replies.size(); ++i) {
      redis::Hash raw = redis::Client::to_hash(replies[i]);
      if (!raw.empty()) {
        data[key_codec_.deserialize_key(rows[i])] = TypeCodec::raw_to_typed(raw);
      }
    }
  });
  return data;
}

void PipelinedTableStore::delete_table(const std::string& table) {
  std::shared_ptr<redis::Client> store = client();
  std::vector<redis::Command> pipe;
  queue_delete_table(*store, table, pipe);
  execute(*store, pipe);
}


//==============================================
// SNAPSHOT OPERATIONS
//==============================================

void PipelinedTableStore::mod_config(const SnapshotPatch& data) {
  std::shared_ptr<redis::Client> store = client();
  std::vector<redis::Command> pipe;

  for (const auto& [table_name, table_data] : data) {
    if (!table_data) {
      // Rows queued so far must land before the table is scanned for deletion
      execute(*store, pipe);
      pipe.clear();
      queue_delete_table(*store, table_name, pipe);
      continue;
    }
    for (const auto& [key, row] : *table_data) {
      queue_mod_entry(table_name, key, row, pipe);
    }
  }

  execute(*store, pipe);
}

Snapshot PipelinedTableStore::get_config() {
  std::shared_ptr<redis::Client> store = client();
  Snapshot data;

  scan_all(*store, "*", [&](const std::vector<std::string>& keys) {
    std::vector<std::string> rows;
    std::vector<redis::Command> pipe;
    for (const auto& key : keys) {
      // Non-table keys such as the init indicator are not hashes
      if (key == INIT_INDICATOR || !key_codec_.split_table_key(key)) {
        continue;
      }
      rows.push_back(key);
      pipe.push_back({"HGETALL", key});
    }

    std::vector<redis::Reply> replies = execute(*store, pipe);
    for (std::size_t i = 0; i < replies.size(); ++i) {
      add_to_snapshot(data, rows[i], redis::Client::to_hash(replies[i]));
    }
  });
  return data;
}


//==============================================
// BULK OPERATIONS
//==============================================

void PipelinedTableStore::set_bulk(const std::vector<std::pair<std::string, redis::Hash>>& payload) {
  std::vector<redis::Command> pipe;
  for (const auto& [hash, fields] : payload) {
    if (fields.empty()) {
      continue;
    }
    redis::Command command{"HSET", hash};
    for (const auto& [field, value] : fields) {
      command.push_back(field);
      command.push_back(value);
    }
    pipe.push_back(std::move(command));
  }
  execute(*client(), pipe);
}

void PipelinedTableStore::del_bulk(const std::vector<std::string>& keys) {
  std::vector<redis::Command> pipe;
  for (const auto& key : keys) {
    pipe.push_back({"DEL", key});
  }
  execute(*client(), pipe);
}

void PipelinedTableStore::hdel_bulk(const std::vector<std::pair<std::string, std::string>>& payload) {
  std::vector<redis::Command> pipe;
  for (const auto& [hash, field] : payload) {
    pipe.push_back({"HDEL", hash, field});
  }
  execute(*client(), pipe);
}

std::vector<redis::Hash> PipelinedTableStore::getall_bulk(const std::vector<std::string>& keys) {
  std::vector<redis::Command> pipe;
  for (const auto& key : keys) {
    pipe.push_back({"HGETALL", key});
  }

  std::vector<redis::Hash> rows;
  for (const auto& reply : execute(*client(), pipe)) {
    rows.push_back(redis::Client::to_hash(reply));
  }
  return rows;
}


//==============================================
// HELPERS
//==============================================

void PipelinedTableStore::scan_all(redis::Client& store, const std::string& pattern,
                                   const BatchHandler& handler) {
  std::uint64_t cursor = 0;
  std::size_t batches = 0;
  do {
    auto [next, keys] = store.scan(cursor, pattern, batch_size_);
    handler(keys);
    cursor = next;
    ++batches;
  } while (cursor != 0);

  BOOST_LOG_TRIVIAL(trace) << "Pipelined table store: Scanned '" << pattern << "' in " << batches << " batches";
}

void PipelinedTableStore::queue_delete_table(redis::Client& store, const std::string& table,
                                             std::vector<redis::Command>& pipe) {
  scan_all(store, key_codec_.table_pattern(table), [&pipe](const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
      pipe.push_back({"DEL", key});
    }
  });
}

void PipelinedTableStore::queue_mod_entry(const std::string& table, const RowKey& key,
                                          const std::optional<Row>& data,
                                          std::vector<redis::Command>& pipe) const {
  const std::string hash = key_codec_.table_key(table, key);
  if (!data) {
    pipe.push_back({"DEL", hash});
    return;
  }

  redis::Command command{"HSET", hash};
  for (const auto& [field, value] : TypeCodec::typed_to_raw(*data)) {
    command.push_back(field);
    command.push_back(value);
  }
  pipe.push_back(std::move(command));
}

std::vector<redis::Reply> PipelinedTableStore::execute(redis::Client& store,
                                                       const std::vector<redis::Command>& pipe) {
  if (pipe.empty()) {
    return {};
  }

  std::vector<redis::Reply> replies = store.pipeline(pipe);
  for (std::size_t i = 0; i < replies.size() && i < pipe.size(); ++i) {
    redis::Client::check(replies[i], pipe[i]);
  }
  return replies;
}

} // namespace table
} // namespace cfgdb
