#ifndef CFGDB_TABLE_KEY_CODEC_HPP
#define CFGDB_TABLE_KEY_CODEC_HPP

#include <optional>
#include <string>
#include <utility>
#include "table/types.hpp"

namespace cfgdb {
namespace table {

// Maps row keys and table names to store keys for one database separator.
// Store keys look like "{TABLE_UPPER}{sep}{part1}{sep}{part2}...".
class KeyCodec {
public:
  explicit KeyCodec(char separator = '|') : separator_(separator) {}

  // ---- ROW KEYS ----
  std::string serialize_key(const RowKey& key) const;
  // More than one part yields a composite key. A one-part tuple and a scalar
  // key encode identically and cannot be told apart here.
  RowKey deserialize_key(const std::string& raw) const;


  // ---- TABLE KEYS ----
  // Full hash key of a row
  std::string table_key(const std::string& table, const RowKey& key) const;
  // Glob matching every row of a table
  std::string table_pattern(const std::string& table) const;
  // Splits a store key at the first separator into (table, serialized row key).
  // Returns nullopt for keys without a separator.
  std::optional<std::pair<std::string, std::string>> split_table_key(const std::string& raw) const;

  static std::string to_upper(const std::string& name);

  char get_separator() const { return separator_; }

private:
  char separator_;
};

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_KEY_CODEC_HPP
