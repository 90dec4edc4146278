#include "table/key_codec.hpp"
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

namespace cfgdb {
namespace table {

std::string KeyCodec::serialize_key(const RowKey& key) const {
  return boost::algorithm::join(key.parts(), std::string(1, separator_));
}

RowKey KeyCodec::deserialize_key(const std::string& raw) const {
  std::vector<std::string> tokens;
  const char separator = separator_;
  boost::algorithm::split(tokens, raw, [separator](char c) { return c == separator; });
  if (tokens.size() > 1) {
    return RowKey(std::move(tokens));
  }
  return RowKey(raw);
}

std::string KeyCodec::table_key(const std::string& table, const RowKey& key) const {
  return to_upper(table) + separator_ + serialize_key(key);
}

std::string KeyCodec::table_pattern(const std::string& table) const {
  return to_upper(table) + separator_ + "*";
}

std::optional<std::pair<std::string, std::string>> KeyCodec::split_table_key(const std::string& raw) const {
  std::size_t pos = raw.find(separator_);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return std::make_pair(raw.substr(0, pos), raw.substr(pos + 1));
}

std::string KeyCodec::to_upper(const std::string& name) {
  return boost::algorithm::to_upper_copy(name);
}

} // namespace table
} // namespace cfgdb
