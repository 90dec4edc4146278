#ifndef CFGDB_DB_READ_RESULT_HPP
#define CFGDB_DB_READ_RESULT_HPP

#include <optional>
#include <string>
#include <utility>
#include "db/db_error.hpp"

namespace cfgdb {
namespace db {

// Outcome of a read that may legitimately find nothing. Missing data is an
// expected state here, so it is a value rather than an exception.
template <typename T>
class ReadResult {
public:
  static ReadResult available(T value) {
    ReadResult result;
    result.value_.emplace(std::move(value));
    return result;
  }

  static ReadResult unavailable(std::string reason) {
    ReadResult result;
    result.reason_ = std::move(reason);
    return result;
  }

  bool has_value() const { return value_.has_value(); }
  explicit operator bool() const { return has_value(); }

  // Throws UnavailableDataError when there is no value
  const T& value() const {
    if (!value_) {
      throw UnavailableDataError(reason_);
    }
    return *value_;
  }

  T value_or(T fallback) const {
    return value_ ? *value_ : std::move(fallback);
  }

  // Why the data was unavailable; empty for available results
  const std::string& reason() const { return reason_; }

private:
  ReadResult() = default;

  std::optional<T> value_;
  std::string reason_;
};

} // namespace db
} // namespace cfgdb

#endif // CFGDB_DB_READ_RESULT_HPP
