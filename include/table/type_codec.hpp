#ifndef CFGDB_TABLE_TYPE_CODEC_HPP
#define CFGDB_TABLE_TYPE_CODEC_HPP

#include "redis/client.hpp"
#include "table/types.hpp"

namespace cfgdb {
namespace table {

// Maps typed rows to the flat hash stored in the database and back.
//
// A list column F = [a, b, c] is stored as field "F@" = "a,b,c". A row with no
// columns is stored as the single field "NULL" = "NULL" so that it still
// exists. Field names ending in '@' and list items containing ',' do not
// survive a round trip.
class TypeCodec {
public:
  static constexpr const char* NULL_FIELD = "NULL";
  static constexpr char LIST_SUFFIX = '@';
  static constexpr char LIST_DELIMITER = ',';

  static redis::Hash typed_to_raw(const Row& row);
  static Row raw_to_typed(const redis::Hash& raw);

  // Field name under which a column is stored
  static std::string raw_field_name(const std::string& field, const FieldValue& value);
};

} // namespace table
} // namespace cfgdb

#endif // CFGDB_TABLE_TYPE_CODEC_HPP
