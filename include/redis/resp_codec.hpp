#ifndef CFGDB_REDIS_RESP_CODEC_HPP
#define CFGDB_REDIS_RESP_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "db/db_error.hpp"

namespace cfgdb {
namespace redis {

// A store command as its argument list, e.g. {"HGETALL", "PORT|Ethernet0"}
using Command = std::vector<std::string>;

// One decoded RESP2 reply
struct Reply {
  enum class Type {
    STATUS,
    ERROR,
    INTEGER,
    BULK,
    NIL,
    ARRAY
  };

  Type type{Type::NIL};
  std::string str;
  long long integer{0};
  std::vector<Reply> elements;

  static Reply status(const std::string& text);
  static Reply error(const std::string& text);
  static Reply number(long long value);
  static Reply bulk(const std::string& text);
  static Reply nil();
  static Reply array(std::vector<Reply> items);

  bool is_error() const { return type == Type::ERROR; }
  bool is_nil() const { return type == Type::NIL; }
  bool is_array() const { return type == Type::ARRAY; }

  bool operator==(const Reply& other) const;
  bool operator!=(const Reply& other) const { return !(*this == other); }
};

// Undecodable bytes on the wire. The stream cannot be resynchronised, so it is
// handled as a connection failure.
class ProtocolError : public db::ConnectionError {
public:
  explicit ProtocolError(const std::string& message)
    : db::ConnectionError("Protocol error: " + message) {}
};

class RespCodec {
public:
  // ---- SERIALIZATION ----
  // Encodes a command as a RESP array of bulk strings
  static std::string encode(const Command& command);
  // Encodes many commands back to back for a single pipelined write
  static std::string encode(const std::vector<Command>& commands);
  // Encodes a reply the way a server would send it
  static std::string encode_reply(const Reply& reply);

  static const char* type_to_string(Reply::Type type);
};

// Incremental reply decoder. Bytes are fed as they arrive from the socket and
// complete replies are pulled out one at a time.
class RespParser {
public:
  static constexpr long long MAX_BULK_LENGTH = 512LL * 1024 * 1024;
  static constexpr int MAX_NESTING = 32;

  // ---- INPUT ----
  void feed(const char* data, std::size_t size);
  void feed(const std::string& data);

  // ---- OUTPUT ----
  // Extracts the next complete reply. Returns false if more bytes are needed.
  // Throws ProtocolError on malformed input.
  bool next(Reply& reply);

  // Number of received bytes not yet consumed
  std::size_t buffered() const { return buffer_.size() - offset_; }

  void reset();

private:
  // ---- PARAMETERS ----
  std::string buffer_;
  std::size_t offset_{0};

  // ---- DECODING ----
  bool parse(std::size_t& pos, Reply& out, int depth) const;
  bool read_line(std::size_t& pos, std::string& line) const;
  static long long parse_integer(const std::string& text);
};

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_RESP_CODEC_HPP
