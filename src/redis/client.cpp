#include "redis/client.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace redis {

//==============================================
// HASH COMMANDS
//==============================================

std::optional<std::string> Client::hget(const std::string& key, const std::string& field) {
  Reply reply = checked({"HGET", key, field});
  if (reply.is_nil()) {
    return std::nullopt;
  }
  return reply.str;
}

Hash Client::hgetall(const std::string& key) {
  return to_hash(checked({"HGETALL", key}));
}

long long Client::hset(const std::string& key, const Hash& fields) {
  if (fields.empty()) {
    return 0;
  }
  Command command{"HSET", key};
  for (const auto& [field, value] : fields) {
    command.push_back(field);
    command.push_back(value);
  }
  return to_integer(checked(command), command);
}

long long Client::hdel(const std::string& key, const std::vector<std::string>& fields) {
  if (fields.empty()) {
    return 0;
  }
  Command command{"HDEL", key};
  command.insert(command.end(), fields.begin(), fields.end());
  return to_integer(checked(command), command);
}


//==============================================
// KEY COMMANDS
//==============================================

long long Client::del(const std::string& key) {
  return del(std::vector<std::string>{key});
}

long long Client::del(const std::vector<std::string>& keys) {
  if (keys.empty()) {
    return 0;
  }
  Command command{"DEL"};
  command.insert(command.end(), keys.begin(), keys.end());
  return to_integer(checked(command), command);
}

std::vector<std::string> Client::keys(const std::string& pattern) {
  return to_strings(checked({"KEYS", pattern}));
}

std::pair<std::uint64_t, std::vector<std::string>> Client::scan(std::uint64_t cursor,
                                                                const std::string& pattern,
                                                                std::size_t count) {
  Command command{"SCAN", std::to_string(cursor), "MATCH", pattern, "COUNT", std::to_string(count)};
  Reply reply = checked(command);

  if (!reply.is_array() || reply.elements.size() != 2) {
    throw db::SchemaError("SCAN: unexpected reply of type " +
                          std::string(RespCodec::type_to_string(reply.type)));
  }

  const std::string& cursor_text = reply.elements[0].str;
  char* end = nullptr;
  std::uint64_t next = std::strtoull(cursor_text.c_str(), &end, 10);
  if (cursor_text.empty() || end != cursor_text.c_str() + cursor_text.size()) {
    throw db::SchemaError("SCAN: invalid cursor '" + cursor_text + "'");
  }
  return {next, to_strings(reply.elements[1])};
}

bool Client::expire(const std::string& key, long long seconds) {
  Command command{"EXPIRE", key, std::to_string(seconds)};
  return to_integer(checked(command), command) == 1;
}

bool Client::exists(const std::string& key) {
  Command command{"EXISTS", key};
  return to_integer(checked(command), command) > 0;
}

std::optional<std::string> Client::get(const std::string& key) {
  Reply reply = checked({"GET", key});
  if (reply.is_nil()) {
    return std::nullopt;
  }
  return reply.str;
}


//==============================================
// SERVER COMMANDS
//==============================================

long long Client::publish(const std::string& channel, const std::string& message) {
  Command command{"PUBLISH", channel, message};
  return to_integer(checked(command), command);
}

void Client::config_set(const std::string& parameter, const std::string& value) {
  checked({"CONFIG", "SET", parameter, value});
}

void Client::ping() {
  checked({"PING"});
}


//==============================================
// REPLY DECODING
//==============================================

const Reply& Client::check(const Reply& reply, const Command& command) {
  if (reply.is_error()) {
    std::string name = command.empty() ? "<empty>" : command.front();
    BOOST_LOG_TRIVIAL(error) << "Client: " << name << " rejected by store: " << reply.str;
    throw db::SchemaError(name + ": " + reply.str);
  }
  return reply;
}

Hash Client::to_hash(const Reply& reply) {
  Hash hash;
  if (reply.is_nil()) {
    return hash;
  }
  if (!reply.is_array() || reply.elements.size() % 2 != 0) {
    throw db::SchemaError("Expected field/value array, got " +
                          std::string(RespCodec::type_to_string(reply.type)));
  }
  for (std::size_t i = 0; i + 1 < reply.elements.size(); i += 2) {
    hash[reply.elements[i].str] = reply.elements[i + 1].str;
  }
  return hash;
}

std::vector<std::string> Client::to_strings(const Reply& reply) {
  std::vector<std::string> items;
  if (reply.is_nil()) {
    return items;
  }
  if (!reply.is_array()) {
    throw db::SchemaError("Expected array, got " +
                          std::string(RespCodec::type_to_string(reply.type)));
  }
  items.reserve(reply.elements.size());
  for (const auto& element : reply.elements) {
    items.push_back(element.str);
  }
  return items;
}

Reply Client::checked(const Command& command) {
  Reply reply = this->command(command);
  check(reply, command);
  return reply;
}

long long Client::to_integer(const Reply& reply, const Command& command) {
  if (reply.type != Reply::Type::INTEGER) {
    throw db::SchemaError(command.front() + ": expected integer reply, got " +
                          std::string(RespCodec::type_to_string(reply.type)));
  }
  return reply.integer;
}

} // namespace redis
} // namespace cfgdb
