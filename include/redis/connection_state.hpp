#ifndef CFGDB_REDIS_CONNECTION_STATE_HPP
#define CFGDB_REDIS_CONNECTION_STATE_HPP

#include <ostream>
#include <string>

namespace cfgdb {
namespace redis {

/**
 * Lifecycle of a single store connection.
 * INITIAL       - socket never opened
 * CONNECTING    - resolving and connecting
 * CONNECTED     - handshake done, commands may be issued
 * DISCONNECTING - close requested
 * DISCONNECTED  - socket closed, may connect again
 * ERROR         - transport failure, must be closed before reuse
 */
class ConnectionState {
public:
  enum class State {
    INITIAL,
    CONNECTING,
    CONNECTED,
    DISCONNECTING,
    DISCONNECTED,
    ERROR
  };

  ConnectionState() : current_state_(State::INITIAL) {}

  State get_state() const { return current_state_; }

  bool is_connected() const { return current_state_ == State::CONNECTED; }

  // True when a new connect() may start from this state
  bool can_connect() const {
    return current_state_ == State::INITIAL ||
           current_state_ == State::DISCONNECTED;
  }

  /**
   * Attempt to transition to a new state.
   * @return true if the transition was applied, false if it is not allowed
   */
  bool transition_to(State new_state) {
    if (!is_valid_transition(current_state_, new_state)) {
      return false;
    }
    current_state_ = new_state;
    return true;
  }

  static bool is_valid_transition(State from, State to) {
    // Any live state can fail
    if (to == State::ERROR) {
      return from != State::ERROR;
    }

    switch (from) {
      case State::INITIAL:
        return to == State::CONNECTING;

      case State::CONNECTING:
        return to == State::CONNECTED ||
               to == State::DISCONNECTED;

      case State::CONNECTED:
        return to == State::DISCONNECTING;

      case State::DISCONNECTING:
        return to == State::DISCONNECTED;

      case State::DISCONNECTED:
        return to == State::CONNECTING;

      case State::ERROR:
        return to == State::DISCONNECTING ||
               to == State::DISCONNECTED;
    }
    return false;
  }

  static std::string state_to_string(State state) {
    switch (state) {
      case State::INITIAL:       return "INITIAL";
      case State::CONNECTING:    return "CONNECTING";
      case State::CONNECTED:     return "CONNECTED";
      case State::DISCONNECTING: return "DISCONNECTING";
      case State::DISCONNECTED:  return "DISCONNECTED";
      case State::ERROR:         return "ERROR";
      default:                   return "UNKNOWN";
    }
  }

  std::string get_state_string() const {
    return state_to_string(current_state_);
  }

private:
  State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionState::State& state) {
  os << ConnectionState::state_to_string(state);
  return os;
}

} // namespace redis
} // namespace cfgdb

#endif // CFGDB_REDIS_CONNECTION_STATE_HPP
