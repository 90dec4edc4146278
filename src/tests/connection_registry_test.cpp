#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "db/connection_registry.hpp"
#include "fake_store.hpp"
#include "test_utils.hpp"

using namespace cfgdb;
using namespace cfgdb::db;

class ConnectionRegistryTest : public ::testing::Test {
protected:
  fake::FakeRedis backend;
  std::unique_ptr<ConnectionRegistry> registry;

  void SetUp() override {
    init_logging();
    registry = std::make_unique<ConnectionRegistry>(config::DatabaseConfig::defaults(), fast_settings(),
                                                    backend.factory());
  }

  void TearDown() override {
    registry.reset();
  }
};

TEST_F(ConnectionRegistryTest, ConnectRegistersHandle) {
  registry->connect(4, "CONFIG_DB", false);

  EXPECT_TRUE(registry->is_registered("CONFIG_DB"));
  EXPECT_TRUE(registry->is_connected("CONFIG_DB"));
  EXPECT_EQ(registry->db_id("CONFIG_DB"), 4);
  EXPECT_EQ(registry->separator("CONFIG_DB"), '|');
  ASSERT_NE(registry->client("CONFIG_DB"), nullptr);
  EXPECT_EQ(backend.connects.load(), 1);
}

TEST_F(ConnectionRegistryTest, SecondConnectIsNoOp) {
  registry->connect(4, "CONFIG_DB", false);
  auto first = registry->client("CONFIG_DB");
  registry->connect(4, "CONFIG_DB", false);

  EXPECT_EQ(registry->client("CONFIG_DB"), first);
  EXPECT_EQ(backend.connects.load(), 1);
}

TEST_F(ConnectionRegistryTest, ConnectByNameUsesCatalogue) {
  registry->connect("APPL_DB", false);
  auto client = std::dynamic_pointer_cast<fake::FakeClient>(registry->client("APPL_DB"));
  ASSERT_TRUE(client);
  EXPECT_EQ(client->get_db_id(), 0);
  EXPECT_EQ(registry->separator("APPL_DB"), ':');
  EXPECT_THROW(registry->connect("NO_SUCH_DB", false), config::ConfigError);
}

TEST_F(ConnectionRegistryTest, UnknownNameRaisesMissingClient) {
  try {
    registry->client("STATE_DB");
    FAIL() << "Expected MissingClientError";
  } catch (const MissingClientError& e) {
    EXPECT_EQ(std::string(e.what()), "No client connected for db_name 'STATE_DB'");
  }
  EXPECT_FALSE(registry->is_registered("STATE_DB"));
  EXPECT_FALSE(registry->is_connected("STATE_DB"));
}

TEST_F(ConnectionRegistryTest, LookupsFallBackToCatalogueAndDefaults) {
  EXPECT_EQ(registry->db_id("STATE_DB"), 6);
  EXPECT_THROW(registry->db_id("CUSTOM_DB"), MissingClientError);
  EXPECT_EQ(registry->separator("CUSTOM_DB"), '|');

  registry->connect(9, "CUSTOM_DB", false);
  EXPECT_EQ(registry->db_id("CUSTOM_DB"), 9);
  EXPECT_EQ(registry->separator("CUSTOM_DB"), '|');
}

TEST_F(ConnectionRegistryTest, InvalidArgumentsAreRejected) {
  EXPECT_THROW(registry->connect(-1, "CONFIG_DB", false), std::invalid_argument);
  EXPECT_THROW(registry->connect(4, "", false), std::invalid_argument);
  EXPECT_THROW(ConnectionRegistry(config::DatabaseConfig::defaults(), fast_settings(), ClientFactory()),
               std::invalid_argument);
}

TEST_F(ConnectionRegistryTest, OneTimeConnectFailurePropagates) {
  backend.fail_connects = 1;
  EXPECT_THROW(registry->connect(4, "CONFIG_DB", false), ConnectionError);
  EXPECT_FALSE(registry->is_registered("CONFIG_DB"));
}

TEST_F(ConnectionRegistryTest, PersistentConnectRetriesUntilSuccess) {
  backend.fail_connects = 3;
  registry->connect(4, "CONFIG_DB", true);

  EXPECT_TRUE(registry->is_connected("CONFIG_DB"));
  EXPECT_EQ(backend.connects.load(), 4);
}

TEST_F(ConnectionRegistryTest, PersistentConnectRetriesRejectedSetup) {
  backend.reject_connects = 2;
  registry->connect(4, "CONFIG_DB", true);

  EXPECT_TRUE(registry->is_connected("CONFIG_DB"));
  EXPECT_EQ(backend.connects.load(), 3);
}

TEST_F(ConnectionRegistryTest, OneTimeConnectPropagatesRejectedSetup) {
  backend.reject_connects = 1;
  EXPECT_THROW(registry->connect(4, "CONFIG_DB", false), SchemaError);
  EXPECT_FALSE(registry->is_registered("CONFIG_DB"));
}

TEST_F(ConnectionRegistryTest, PersistentConnectCanBeCancelled) {
  backend.fail_connects = 1000000;
  utils::CancellationToken cancel;

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    cancel.cancel();
  });
  EXPECT_THROW(registry->connect(4, "CONFIG_DB", true, cancel), CancelledError);
  canceller.join();

  EXPECT_FALSE(registry->is_registered("CONFIG_DB"));
}

TEST_F(ConnectionRegistryTest, CloseIsIdempotent) {
  registry->connect(4, "CONFIG_DB", false);
  auto client = registry->client("CONFIG_DB");

  registry->close("CONFIG_DB");
  EXPECT_FALSE(registry->is_registered("CONFIG_DB"));
  EXPECT_FALSE(client->is_connected());
  EXPECT_NO_THROW(registry->close("CONFIG_DB"));
  EXPECT_NO_THROW(registry->close("NEVER_CONNECTED"));
}

TEST_F(ConnectionRegistryTest, ReconnectReplacesClient) {
  registry->connect(4, "CONFIG_DB", false);
  auto before = registry->client("CONFIG_DB");

  registry->reconnect("CONFIG_DB");
  auto after = registry->client("CONFIG_DB");

  EXPECT_NE(before, after);
  EXPECT_FALSE(before->is_connected());
  EXPECT_TRUE(after->is_connected());
  EXPECT_EQ(registry->db_id("CONFIG_DB"), 4);
  EXPECT_THROW(registry->reconnect("NEVER_CONNECTED"), MissingClientError);
}

TEST_F(ConnectionRegistryTest, ReconnectWorksAfterClose) {
  registry->connect(4, "CONFIG_DB", false);
  registry->close("CONFIG_DB");
  registry->reconnect("CONFIG_DB");
  EXPECT_TRUE(registry->is_connected("CONFIG_DB"));
}

TEST_F(ConnectionRegistryTest, CloseAllClosesEveryHandle) {
  registry->connect("CONFIG_DB", false);
  registry->connect("APPL_DB", false);
  registry->close_all();
  EXPECT_FALSE(registry->is_registered("CONFIG_DB"));
  EXPECT_FALSE(registry->is_registered("APPL_DB"));
}

TEST_F(ConnectionRegistryTest, KeyspaceSubscriptionLifecycle) {
  registry->connect(4, "CONFIG_DB", false);
  EXPECT_FALSE(registry->has_subscription("CONFIG_DB"));
  EXPECT_THROW(registry->subscription("CONFIG_DB"), MissingClientError);

  registry->subscribe_keyspace("CONFIG_DB");
  ASSERT_TRUE(registry->has_subscription("CONFIG_DB"));

  registry->client("CONFIG_DB")->hset("PORT|Ethernet0", {{"mtu", "9100"}});
  auto message = registry->subscription("CONFIG_DB").get_message(std::chrono::milliseconds(200));
  ASSERT_TRUE(message);
  EXPECT_EQ(message->pattern, "__key*__:*");
  EXPECT_EQ(message->channel, "__keyspace@4__:PORT|Ethernet0");
  EXPECT_EQ(message->data, "hset");

  registry->unsubscribe_keyspace("CONFIG_DB");
  EXPECT_FALSE(registry->has_subscription("CONFIG_DB"));
  EXPECT_NO_THROW(registry->unsubscribe_keyspace("CONFIG_DB"));
}

TEST_F(ConnectionRegistryTest, CloseDropsSubscription) {
  registry->connect(4, "CONFIG_DB", false);
  registry->subscribe_keyspace("CONFIG_DB");
  registry->close("CONFIG_DB");

  registry->connect(4, "CONFIG_DB", false);
  EXPECT_FALSE(registry->has_subscription("CONFIG_DB"));
}
