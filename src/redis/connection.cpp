#include "redis/connection.hpp"
#include <boost/log/trivial.hpp>

namespace cfgdb {
namespace redis {

std::string Endpoint::to_string() const {
  if (!unix_socket_path.empty()) {
    return "unix:" + unix_socket_path;
  }
  return host + ":" + std::to_string(port);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection()
  : socket_(io_context_) {}

Connection::~Connection() {
  close();
}


//==============================================
// CONNECTION CONTROL
//==============================================

void Connection::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
  if (!state_.can_connect()) {
    close();
  }

  endpoint_ = endpoint;
  state_.transition_to(ConnectionState::State::CONNECTING);
  parser_.reset();
  BOOST_LOG_TRIVIAL(debug) << "Connection: Connecting to " << endpoint_.to_string();

  std::string error;
  bool connected = false;

  if (!endpoint_.unix_socket_path.empty()) {
    boost::asio::local::stream_protocol::endpoint local(endpoint_.unix_socket_path);
    connected = try_connect(local, timeout, error);
  } else {
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec);
    if (ec) {
      error = "resolve failed: " + ec.message();
    }
    for (const auto& entry : results) {
      if (try_connect(entry.endpoint(), timeout, error)) {
        connected = true;
        break;
      }
    }
  }

  if (!connected) {
    close_socket();
    state_.transition_to(ConnectionState::State::DISCONNECTED);
    BOOST_LOG_TRIVIAL(warning) << "Connection: Failed to connect to " << endpoint_.to_string()
                               << ": " << error;
    throw db::ConnectionError("Cannot connect to " + endpoint_.to_string() + ": " + error);
  }

  state_.transition_to(ConnectionState::State::CONNECTED);
  BOOST_LOG_TRIVIAL(info) << "Connection: Connected to " << endpoint_.to_string();
}

bool Connection::try_connect(const boost::asio::generic::stream_protocol::endpoint& endpoint,
                             std::chrono::milliseconds timeout, std::string& error) {
  close_socket();

  boost::system::error_code result = boost::asio::error::would_block;
  socket_.async_connect(endpoint, [&result](const boost::system::error_code& ec) {
    result = ec;
  });

  if (!run_for(timeout) || result == boost::asio::error::operation_aborted) {
    error = "connect timed out";
    return false;
  }
  if (result) {
    error = result.message();
    return false;
  }
  return true;
}

void Connection::close() {
  if (state_.get_state() == ConnectionState::State::CONNECTED ||
      state_.get_state() == ConnectionState::State::ERROR) {
    state_.transition_to(ConnectionState::State::DISCONNECTING);
    close_socket();
    state_.transition_to(ConnectionState::State::DISCONNECTED);
    BOOST_LOG_TRIVIAL(debug) << "Connection: Closed connection to " << endpoint_.to_string();
  } else {
    close_socket();
  }
  parser_.reset();
}


//==============================================
// COMMAND EXECUTION
//==============================================

Reply Connection::execute(const Command& command, std::chrono::milliseconds timeout) {
  require_connected(command.empty() ? "command" : command.front());
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  write_all(RespCodec::encode(command), timeout);
  return read_one(deadline);
}

std::vector<Reply> Connection::execute_pipeline(const std::vector<Command>& commands,
                                                std::chrono::milliseconds timeout) {
  std::vector<Reply> replies;
  if (commands.empty()) {
    return replies;
  }
  require_connected("pipeline");

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  write_all(RespCodec::encode(commands), timeout);
  BOOST_LOG_TRIVIAL(trace) << "Connection: Pipelined " << commands.size() << " commands";

  replies.reserve(commands.size());
  for (std::size_t i = 0; i < commands.size(); ++i) {
    replies.push_back(read_one(deadline));
  }
  return replies;
}

void Connection::send(const Command& command, std::chrono::milliseconds timeout) {
  require_connected(command.empty() ? "command" : command.front());
  write_all(RespCodec::encode(command), timeout);
}

std::optional<Reply> Connection::read_reply(std::chrono::milliseconds timeout) {
  require_connected("read");
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    Reply reply;
    try {
      if (parser_.next(reply)) {
        return reply;
      }
    } catch (const ProtocolError& e) {
      throw fail(e.what());
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !fill_parser(remaining)) {
      return std::nullopt;
    }
  }
}


//==============================================
// I/O HELPERS
//==============================================

bool Connection::run_for(std::chrono::milliseconds timeout) {
  io_context_.restart();
  io_context_.run_for(timeout);

  if (!io_context_.stopped()) {
    // Timed out: cancel the outstanding operation and let its handler run
    boost::system::error_code ec;
    socket_.cancel(ec);
    io_context_.run();
    return false;
  }
  return true;
}

void Connection::write_all(const std::string& data, std::chrono::milliseconds timeout) {
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(socket_, boost::asio::buffer(data),
    [&result](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      result = ec;
    });

  run_for(timeout);

  if (result == boost::asio::error::operation_aborted || result == boost::asio::error::would_block) {
    // A partial write leaves the stream unusable
    throw fail("write timed out");
  }
  if (result) {
    throw fail("write failed: " + result.message());
  }
}

bool Connection::fill_parser(std::chrono::milliseconds timeout) {
  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t bytes_read = 0;
  socket_.async_read_some(boost::asio::buffer(read_buffer_),
    [&result, &bytes_read](const boost::system::error_code& ec, std::size_t bytes_transferred) {
      result = ec;
      bytes_read = bytes_transferred;
    });

  run_for(timeout);

  if (result == boost::asio::error::operation_aborted || result == boost::asio::error::would_block) {
    return false;
  }
  if (result) {
    throw fail("read failed: " + result.message());
  }

  parser_.feed(read_buffer_.data(), bytes_read);
  return true;
}

Reply Connection::read_one(std::chrono::steady_clock::time_point deadline) {
  while (true) {
    Reply reply;
    try {
      if (parser_.next(reply)) {
        return reply;
      }
    } catch (const ProtocolError& e) {
      throw fail(e.what());
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !fill_parser(remaining)) {
      throw fail("timed out waiting for reply");
    }
  }
}

void Connection::require_connected(const std::string& operation) const {
  if (!state_.is_connected()) {
    throw db::ConnectionError("Cannot run " + operation + " on " + endpoint_.to_string() +
                              " in state " + state_.get_state_string());
  }
}


//==============================================
// TEARDOWN
//==============================================

void Connection::close_socket() {
  if (socket_.is_open()) {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::socket_base::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Connection: Socket close error: " << ec.message();
    }
  }
}

db::ConnectionError Connection::fail(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Connection: " << endpoint_.to_string() << ": " << message;
  state_.transition_to(ConnectionState::State::ERROR);
  close();
  return db::ConnectionError(endpoint_.to_string() + ": " + message);
}

} // namespace redis
} // namespace cfgdb
