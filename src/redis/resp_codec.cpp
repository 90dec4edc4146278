#include "redis/resp_codec.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace redis {

//==============================================
// REPLY CONSTRUCTION
//==============================================

Reply Reply::status(const std::string& text) {
  Reply reply;
  reply.type = Type::STATUS;
  reply.str = text;
  return reply;
}

Reply Reply::error(const std::string& text) {
  Reply reply;
  reply.type = Type::ERROR;
  reply.str = text;
  return reply;
}

Reply Reply::number(long long value) {
  Reply reply;
  reply.type = Type::INTEGER;
  reply.integer = value;
  return reply;
}

Reply Reply::bulk(const std::string& text) {
  Reply reply;
  reply.type = Type::BULK;
  reply.str = text;
  return reply;
}

Reply Reply::nil() {
  return Reply();
}

Reply Reply::array(std::vector<Reply> items) {
  Reply reply;
  reply.type = Type::ARRAY;
  reply.elements = std::move(items);
  return reply;
}

bool Reply::operator==(const Reply& other) const {
  return type == other.type &&
         str == other.str &&
         integer == other.integer &&
         elements == other.elements;
}


//==============================================
// SERIALIZATION
//==============================================

std::string RespCodec::encode(const Command& command) {
  std::string out;
  out.reserve(16 * (command.size() + 1));
  out += "*" + std::to_string(command.size()) + "\r\n";
  for (const auto& arg : command) {
    out += "$" + std::to_string(arg.size()) + "\r\n";
    out += arg;
    out += "\r\n";
  }
  return out;
}

std::string RespCodec::encode(const std::vector<Command>& commands) {
  std::string out;
  for (const auto& command : commands) {
    out += encode(command);
  }
  return out;
}

std::string RespCodec::encode_reply(const Reply& reply) {
  switch (reply.type) {
    case Reply::Type::STATUS:
      return "+" + reply.str + "\r\n";
    case Reply::Type::ERROR:
      return "-" + reply.str + "\r\n";
    case Reply::Type::INTEGER:
      return ":" + std::to_string(reply.integer) + "\r\n";
    case Reply::Type::BULK:
      return "$" + std::to_string(reply.str.size()) + "\r\n" + reply.str + "\r\n";
    case Reply::Type::NIL:
      return "$-1\r\n";
    case Reply::Type::ARRAY: {
      std::string out = "*" + std::to_string(reply.elements.size()) + "\r\n";
      for (const auto& element : reply.elements) {
        out += encode_reply(element);
      }
      return out;
    }
  }
  return "";
}

const char* RespCodec::type_to_string(Reply::Type type) {
  switch (type) {
    case Reply::Type::STATUS:  return "STATUS";
    case Reply::Type::ERROR:   return "ERROR";
    case Reply::Type::INTEGER: return "INTEGER";
    case Reply::Type::BULK:    return "BULK";
    case Reply::Type::NIL:     return "NIL";
    case Reply::Type::ARRAY:   return "ARRAY";
    default:                   return "UNKNOWN";
  }
}


//==============================================
// INCREMENTAL DECODING
//==============================================

void RespParser::feed(const char* data, std::size_t size) {
  // Drop the consumed prefix before growing the buffer
  if (offset_ > 0 && (offset_ == buffer_.size() || offset_ > 64 * 1024)) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
  buffer_.append(data, size);
}

void RespParser::feed(const std::string& data) {
  feed(data.data(), data.size());
}

bool RespParser::next(Reply& reply) {
  std::size_t pos = offset_;
  Reply parsed;
  if (!parse(pos, parsed, 0)) {
    return false;
  }
  offset_ = pos;
  reply = std::move(parsed);
  return true;
}

void RespParser::reset() {
  buffer_.clear();
  offset_ = 0;
}

bool RespParser::read_line(std::size_t& pos, std::string& line) const {
  std::size_t end = buffer_.find("\r\n", pos);
  if (end == std::string::npos) {
    return false;
  }
  line.assign(buffer_, pos, end - pos);
  pos = end + 2;
  return true;
}

long long RespParser::parse_integer(const std::string& text) {
  if (text.empty()) {
    throw ProtocolError("Empty integer field");
  }
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size()) {
    throw ProtocolError("Invalid integer field: " + text);
  }
  return value;
}

bool RespParser::parse(std::size_t& pos, Reply& out, int depth) const {
  if (depth > MAX_NESTING) {
    throw ProtocolError("Reply nesting too deep");
  }
  if (pos >= buffer_.size()) {
    return false;
  }

  const char type = buffer_[pos];
  std::size_t cursor = pos + 1;
  std::string line;
  if (!read_line(cursor, line)) {
    return false;
  }

  switch (type) {
    case '+':
      out = Reply::status(line);
      break;

    case '-':
      out = Reply::error(line);
      break;

    case ':':
      out = Reply::number(parse_integer(line));
      break;

    case '$': {
      long long length = parse_integer(line);
      if (length == -1) {
        out = Reply::nil();
        break;
      }
      if (length < 0 || length > MAX_BULK_LENGTH) {
        throw ProtocolError("Invalid bulk length: " + line);
      }
      std::size_t size = static_cast<std::size_t>(length);
      if (buffer_.size() < cursor + size + 2) {
        return false;
      }
      if (buffer_.compare(cursor + size, 2, "\r\n") != 0) {
        throw ProtocolError("Bulk string not terminated by CRLF");
      }
      out = Reply::bulk(buffer_.substr(cursor, size));
      cursor += size + 2;
      break;
    }

    case '*': {
      long long count = parse_integer(line);
      if (count == -1) {
        out = Reply::nil();
        break;
      }
      if (count < 0) {
        throw ProtocolError("Invalid array length: " + line);
      }
      std::vector<Reply> items;
      items.reserve(static_cast<std::size_t>(std::min<long long>(count, 1024)));
      for (long long i = 0; i < count; ++i) {
        Reply item;
        if (!parse(cursor, item, depth + 1)) {
          return false;
        }
        items.push_back(std::move(item));
      }
      out = Reply::array(std::move(items));
      break;
    }

    default:
      BOOST_LOG_TRIVIAL(error) << "RESP parser: Unexpected type byte 0x"
                               << std::hex << static_cast<int>(static_cast<unsigned char>(type));
      throw ProtocolError(std::string("Unexpected reply type byte '") + type + "'");
  }

  pos = cursor;
  return true;
}

} // namespace redis
} // namespace cfgdb
