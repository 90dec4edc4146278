#ifndef CFGDB_TABLE_TABLE_STORE_HPP
#define CFGDB_TABLE_TABLE_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "db/connection_registry.hpp"
#include "table/key_codec.hpp"
#include "table/type_codec.hpp"
#include "table/types.hpp"
#include "utils/cancellation.hpp"

namespace cfgdb {
namespace table {

// Typed table access on top of one logical database. Every operation maps to
// plain per-key commands; see PipelinedTableStore for the batched variant.
//
// Writers in other processes are not locked out. set_entry reads, writes and
// then removes stale fields as separate commands, so a concurrent writer can
// lose fields it added in between. Last writer wins per field.
class TableStore {
public:
  static constexpr const char* INIT_INDICATOR = "CONFIG_DB_INITIALIZED";
  static constexpr const char* CONFIG_DB = "CONFIG_DB";


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TableStore(db::ConnectionRegistry& registry);
  virtual ~TableStore() = default;


  // ---- CONNECTION ----
  // Connects db_name through the registry and adopts its separator. With
  // wait_for_init, blocks until CONFIG_DB_INITIALIZED is set.
  void db_connect(const std::string& db_name, bool wait_for_init = false, bool retry_on = false,
                  utils::CancellationToken& cancel = utils::CancellationToken::none());
  void connect(bool wait_for_init = true, bool retry_on = false,
               utils::CancellationToken& cancel = utils::CancellationToken::none());


  // ---- ENTRY OPERATIONS ----
  // Empty row if the entry does not exist
  Row get_entry(const std::string& table, const RowKey& key);
  // Replaces the entry, removing fields not in data. nullopt deletes it.
  void set_entry(const std::string& table, const RowKey& key, const std::optional<Row>& data);
  // Upserts the fields in data, keeping the others. nullopt deletes the entry.
  void mod_entry(const std::string& table, const RowKey& key, const std::optional<Row>& data);
  // Row keys of a table. With split false the table prefix is kept in the key.
  std::vector<RowKey> get_keys(const std::string& table, bool split = true);


  // ---- TABLE OPERATIONS ----
  virtual Table get_table(const std::string& table);
  virtual void delete_table(const std::string& table);


  // ---- SNAPSHOT OPERATIONS ----
  // Writes several tables; existing fields and rows not mentioned are kept
  virtual void mod_config(const SnapshotPatch& data);
  virtual Snapshot get_config();


  // ---- GETTERS ----
  const std::string& get_db_name() const { return db_name_; }
  const KeyCodec& get_key_codec() const { return key_codec_; }

protected:
  // ---- PARAMETERS ----
  db::ConnectionRegistry& registry_;
  std::string db_name_;
  KeyCodec key_codec_;


  // ---- HELPERS ----
  std::shared_ptr<redis::Client> client() const;
  // Adds a decoded row under its table. Returns false for keys that are not table rows.
  bool add_to_snapshot(Snapshot& data, const std::string& key, const redis::Hash& raw) const;

private:
  void wait_for_db_init(utils::CancellationToken& cancel);
};

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_TABLE_STORE_HPP
