#ifndef CFGDB_REDIS_CONNECTION_HPP
#define CFGDB_REDIS_CONNECTION_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "redis/connection_state.hpp"
#include "redis/resp_codec.hpp"

namespace cfgdb {
namespace redis {

// Where a store instance listens. A non-empty unix_socket_path takes precedence
// over host and port.
struct Endpoint {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket_path;

  std::string to_string() const;
};

// A single stream connection to the store. Every operation is bounded by a
// timeout; a transport failure closes the socket and throws ConnectionError.
// Not thread safe, callers serialise access.
class Connection {
public:
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Connection();
  ~Connection();


  // ---- CONNECTION CONTROL ----
  void connect(const Endpoint& endpoint, std::chrono::milliseconds timeout);
  void close();


  // ---- COMMAND EXECUTION ----
  // Sends one command and waits for its reply
  Reply execute(const Command& command, std::chrono::milliseconds timeout);
  // Sends all commands in one write, then reads exactly one reply per command
  std::vector<Reply> execute_pipeline(const std::vector<Command>& commands,
                                      std::chrono::milliseconds timeout);
  // Sends a command without waiting for a reply
  void send(const Command& command, std::chrono::milliseconds timeout);
  // Waits for the next reply. Returns nullopt on timeout and keeps the
  // connection usable, which is what pub/sub polling needs.
  std::optional<Reply> read_reply(std::chrono::milliseconds timeout);


  // ---- GETTERS ----
  bool is_connected() const { return state_.is_connected(); }
  ConnectionState::State get_state() const { return state_.get_state(); }
  const Endpoint& get_endpoint() const { return endpoint_; }

private:
  // ---- PARAMETERS ----
  Endpoint endpoint_;
  ConnectionState state_;
  RespParser parser_;

  // Network components
  boost::asio::io_context io_context_;
  boost::asio::generic::stream_protocol::socket socket_;
  std::array<char, 8192> read_buffer_;


  // ---- I/O HELPERS ----
  // Runs the io_context until the pending operation completes or the timeout
  // expires. On expiry the operation is cancelled. Returns false on expiry.
  bool run_for(std::chrono::milliseconds timeout);
  // Attempts one connect to a resolved endpoint
  bool try_connect(const boost::asio::generic::stream_protocol::endpoint& endpoint,
                   std::chrono::milliseconds timeout, std::string& error);
  void write_all(const std::string& data, std::chrono::milliseconds timeout);
  // Reads more bytes into the parser. Returns false on timeout.
  bool fill_parser(std::chrono::milliseconds timeout);
  // Reads one complete reply, failing the connection on timeout
  Reply read_one(std::chrono::steady_clock::time_point deadline);
  void require_connected(const std::string& operation) const;


  // ---- TEARDOWN ----
  void close_socket();
  // Marks the connection failed and closes it. Returns the error to throw.
  db::ConnectionError fail(const std::string& message);
};

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_CONNECTION_HPP
