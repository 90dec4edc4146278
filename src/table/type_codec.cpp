#include "table/type_codec.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

namespace cfgdb {
namespace table {

std::ostream& operator<<(std::ostream& os, const RowKey& key) {
  if (key.is_composite()) {
    os << "(" << boost::algorithm::join(key.parts(), ", ") << ")";
  } else if (key.size() == 1) {
    os << key.parts().front();
  }
  return os;
}

redis::Hash TypeCodec::typed_to_raw(const Row& row) {
  redis::Hash raw;
  if (row.empty()) {
    raw[NULL_FIELD] = NULL_FIELD;
    return raw;
  }

  for (const auto& [field, value] : row) {
    if (const auto* items = std::get_if<std::vector<std::string>>(&value)) {
      raw[field + LIST_SUFFIX] = boost::algorithm::join(*items, std::string(1, LIST_DELIMITER));
    } else {
      raw[field] = std::get<std::string>(value);
    }
  }
  return raw;
}

Row TypeCodec::raw_to_typed(const redis::Hash& raw) {
  Row row;
  for (const auto& [field, value] : raw) {
    if (field == NULL_FIELD) {
      continue;
    }
    if (!field.empty() && field.back() == LIST_SUFFIX) {
      std::vector<std::string> items;
      boost::algorithm::split(items, value, [](char c) { return c == LIST_DELIMITER; });
      row[field.substr(0, field.size() - 1)] = std::move(items);
    } else {
      row[field] = value;
    }
  }
  return row;
}

std::string TypeCodec::raw_field_name(const std::string& field, const FieldValue& value) {
  return is_list(value) ? field + LIST_SUFFIX : field;
}

} // namespace table
} // namespace cfgdb
