#include <gtest/gtest.h>
#include <sstream>
#include "redis/connection_state.hpp"

using namespace cfgdb::redis;

class ConnectionStateTest : public ::testing::Test {
protected:
  ConnectionState state;
};

// Test initial state
TEST_F(ConnectionStateTest, InitialState) {
  EXPECT_EQ(state.get_state(), ConnectionState::State::INITIAL);
  EXPECT_EQ(state.get_state_string(), "INITIAL");
  EXPECT_FALSE(state.is_connected());
  EXPECT_TRUE(state.can_connect());
}

// Test a full connect, close and reconnect cycle
TEST_F(ConnectionStateTest, ValidTransitions) {
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTING));
  EXPECT_FALSE(state.can_connect());
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTED));
  EXPECT_TRUE(state.is_connected());
  EXPECT_TRUE(state.transition_to(ConnectionState::State::DISCONNECTING));
  EXPECT_TRUE(state.transition_to(ConnectionState::State::DISCONNECTED));
  EXPECT_TRUE(state.can_connect());
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTING));
}

// A failed connect attempt goes straight back to DISCONNECTED
TEST_F(ConnectionStateTest, ConnectAttemptCanFail) {
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTING));
  EXPECT_TRUE(state.transition_to(ConnectionState::State::DISCONNECTED));
  EXPECT_TRUE(state.can_connect());
}

TEST_F(ConnectionStateTest, InvalidTransitions) {
  EXPECT_FALSE(state.transition_to(ConnectionState::State::CONNECTED));
  EXPECT_FALSE(state.transition_to(ConnectionState::State::DISCONNECTED));
  EXPECT_EQ(state.get_state(), ConnectionState::State::INITIAL);

  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTING));
  EXPECT_FALSE(state.transition_to(ConnectionState::State::DISCONNECTING));
  EXPECT_EQ(state.get_state(), ConnectionState::State::CONNECTING);
}

TEST_F(ConnectionStateTest, ErrorStateHandling) {
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTING));
  EXPECT_TRUE(state.transition_to(ConnectionState::State::CONNECTED));
  EXPECT_TRUE(state.transition_to(ConnectionState::State::ERROR));
  EXPECT_FALSE(state.is_connected());

  // ERROR must be closed before reuse
  EXPECT_FALSE(state.transition_to(ConnectionState::State::ERROR));
  EXPECT_FALSE(state.transition_to(ConnectionState::State::CONNECTING));
  EXPECT_FALSE(state.can_connect());
  EXPECT_TRUE(state.transition_to(ConnectionState::State::DISCONNECTED));
  EXPECT_TRUE(state.can_connect());
}

TEST_F(ConnectionStateTest, StreamsStateName) {
  std::ostringstream out;
  out << ConnectionState::State::DISCONNECTING;
  EXPECT_EQ(out.str(), "DISCONNECTING");
}
