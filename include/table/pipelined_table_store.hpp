#ifndef CFGDB_TABLE_PIPELINED_TABLE_STORE_HPP
#define CFGDB_TABLE_PIPELINED_TABLE_STORE_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "redis/client.hpp"
#include "table/table_store.hpp"

namespace cfgdb {
namespace table {

// TableStore whose whole-table and whole-snapshot operations enumerate with
// SCAN in fixed-size batches and send each batch as one pipeline. Results are
// the same as TableStore for the same input.
class PipelinedTableStore : public TableStore {
public:
  explicit PipelinedTableStore(db::ConnectionRegistry& registry);


  // ---- TABLE OPERATIONS ----
  Table get_table(const std::string& table) override;
  void delete_table(const std::string& table) override;


  // ---- SNAPSHOT OPERATIONS ----
  // One pipeline, split before each table deletion that follows queued writes
  void mod_config(const SnapshotPatch& data) override;
  Snapshot get_config() override;


  // ---- BULK OPERATIONS ----
  void set_bulk(const std::vector<std::pair<std::string, redis::Hash>>& payload);
  void del_bulk(const std::vector<std::string>& keys);
  void hdel_bulk(const std::vector<std::pair<std::string, std::string>>& payload);
  std::vector<redis::Hash> getall_bulk(const std::vector<std::string>& keys);

private:
  // Keys of one SCAN batch
  using BatchHandler = std::function<void(const std::vector<std::string>&)>;

  std::size_t batch_size_;

  // Runs SCAN from cursor 0 until it returns to 0, handing each batch to handler
  void scan_all(redis::Client& store, const std::string& pattern, const BatchHandler& handler);
  // Queues DEL for every key of a table
  void queue_delete_table(redis::Client& store, const std::string& table, std::vector<redis::Command>& pipe);
  void queue_mod_entry(const std::string& table, const RowKey& key, const std::optional<Row>& data,
                       std::vector<redis::Command>& pipe) const;
  // Executes the queued commands and throws SchemaError if any was rejected
  std::vector<redis::Reply> execute(redis::Client& store, const std::vector<redis::Command>& pipe);
};

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_PIPELINED_TABLE_STORE_HPP
