#ifndef CFGDB_DB_ERROR_HPP
#define CFGDB_DB_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cfgdb {
namespace db {

class DbError : public std::runtime_error {
public:
  explicit DbError(const std::string& message)
    : std::runtime_error(message) {}
};

// Transport or network failure. Retried by the blocking access protocol.
class ConnectionError : public DbError {
public:
  explicit ConnectionError(const std::string& message)
    : DbError("Connection error: " + message) {}
};

// The store rejected the request itself (error reply). Never retried.
class SchemaError : public DbError {
public:
  explicit SchemaError(const std::string& message)
    : DbError("Bad DB request: " + message) {}
};

// Operation addressed to a database name that was never connected.
class MissingClientError : public DbError {
public:
  explicit MissingClientError(const std::string& db_name)
    : DbError("No client connected for db_name '" + db_name + "'") {}
};

class UnavailableDataError : public DbError {
public:
  explicit UnavailableDataError(const std::string& message)
    : DbError("Data unavailable: " + message) {}
};

class CancelledError : public DbError {
public:
  explicit CancelledError(const std::string& message)
    : DbError("Cancelled: " + message) {}
};

} // namespace db
} // namespace cfgdb

#endif // CFGDB_DB_ERROR_HPP
