#ifndef CFGDB_TABLE_TYPES_HPP
#define CFGDB_TABLE_TYPES_HPP

#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace cfgdb {
namespace table {

// A column value: a scalar string or an ordered list of strings
using FieldValue = std::variant<std::string, std::vector<std::string>>;

// Typed row: column name -> value
using Row = std::map<std::string, FieldValue>;

// Row key as an ordered list of parts. One part is a plain key, more than one
// a multi-part (tuple) key.
class RowKey {
public:
  RowKey() = default;
  RowKey(const char* key) : parts_{key} {}
  RowKey(std::string key) : parts_{std::move(key)} {}
  RowKey(std::initializer_list<std::string> parts) : parts_(parts) {}
  explicit RowKey(std::vector<std::string> parts) : parts_(std::move(parts)) {}

  bool is_composite() const { return parts_.size() > 1; }
  const std::vector<std::string>& parts() const { return parts_; }
  std::size_t size() const { return parts_.size(); }

  bool operator==(const RowKey& other) const { return parts_ == other.parts_; }
  bool operator!=(const RowKey& other) const { return parts_ != other.parts_; }
  bool operator<(const RowKey& other) const { return parts_ < other.parts_; }

private:
  std::vector<std::string> parts_;
};

std::ostream& operator<<(std::ostream& os, const RowKey& key);

// Whole table: row key -> row
using Table = std::map<RowKey, Row>;

// Whole database content: table name -> table
using Snapshot = std::map<std::string, Table>;

// Snapshot update. A table mapped to nullopt is deleted.
using SnapshotPatch = std::map<std::string, std::optional<Table>>;

inline bool is_list(const FieldValue& value) {
  return std::holds_alternative<std::vector<std::string>>(value);
}

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_TYPES_HPP
