#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "config/connector_settings.hpp"
#include "config/database_config.hpp"
#include "test_utils.hpp"

using namespace cfgdb::config;

class DatabaseConfigTest : public ::testing::Test {
protected:
  const std::string CATALOGUE = R"({
    "INSTANCES": {
      "redis": { "hostname": "10.1.1.1", "port": 6380, "unix_socket_path": "/tmp/redis.sock" },
      "redis_chassis": { "hostname": "10.1.1.2", "port": 6381 }
    },
    "DATABASES": {
      "CONFIG_DB": { "id": 4, "separator": "|", "instance": "redis" },
      "APPL_DB": { "id": 0, "separator": ":", "instance": "redis" },
      "CHASSIS_APP_DB": { "id": 12, "separator": "|", "instance": "redis_chassis" }
    }
  })";

  void SetUp() override {
    init_logging();
  }

  DatabaseConfig parse(const std::string& text) {
    std::istringstream input(text);
    return DatabaseConfig::parse(input);
  }
};

TEST_F(DatabaseConfigTest, DefaultCatalogue) {
  DatabaseConfig config = DatabaseConfig::defaults();

  EXPECT_EQ(config.db_id("APPL_DB"), 0);
  EXPECT_EQ(config.db_id("CONFIG_DB"), 4);
  EXPECT_EQ(config.db_id("PFC_WD_DB"), 5);
  EXPECT_EQ(config.db_id("FLEX_COUNTER_DB"), 5);
  EXPECT_EQ(config.db_id("SNMP_OVERLAY_DB"), 7);
  EXPECT_EQ(config.separator("CONFIG_DB"), '|');
  EXPECT_EQ(config.separator("STATE_DB"), '|');
  EXPECT_EQ(config.separator("APPL_DB"), ':');
  EXPECT_EQ(config.separator("COUNTERS_DB"), ':');
  EXPECT_EQ(config.database_names().size(), 9u);

  cfgdb::redis::Endpoint tcp = config.endpoint("CONFIG_DB", false);
  EXPECT_EQ(tcp.host, "127.0.0.1");
  EXPECT_EQ(tcp.port, 6379);
  EXPECT_TRUE(tcp.unix_socket_path.empty());
  EXPECT_EQ(config.endpoint("CONFIG_DB", true).unix_socket_path, DatabaseConfig::DEFAULT_UNIX_SOCKET_PATH);
}

TEST_F(DatabaseConfigTest, ParsesJsonCatalogue) {
  DatabaseConfig config = parse(CATALOGUE);

  EXPECT_TRUE(config.has_database("CHASSIS_APP_DB"));
  EXPECT_FALSE(config.has_database("STATE_DB"));
  EXPECT_EQ(config.db_id("CHASSIS_APP_DB"), 12);
  EXPECT_EQ(config.separator("APPL_DB"), ':');
  EXPECT_EQ(config.database("CONFIG_DB").instance, "redis");

  cfgdb::redis::Endpoint endpoint = config.endpoint("CHASSIS_APP_DB", false);
  EXPECT_EQ(endpoint.host, "10.1.1.2");
  EXPECT_EQ(endpoint.port, 6381);
  EXPECT_EQ(config.endpoint("CONFIG_DB", true).unix_socket_path, "/tmp/redis.sock");
}

TEST_F(DatabaseConfigTest, LoadsFromFile) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / "cfgdb_database_config.json";
  {
    std::ofstream file(path);
    file << CATALOGUE;
  }
  DatabaseConfig config = DatabaseConfig::load(path.string());
  std::filesystem::remove(path);

  EXPECT_EQ(config.db_id("CONFIG_DB"), 4);
}

TEST_F(DatabaseConfigTest, MissingFileIsConfigError) {
  EXPECT_THROW(DatabaseConfig::load("/nonexistent/database_config.json"), ConfigError);
}

TEST_F(DatabaseConfigTest, InvalidDocumentsAreConfigErrors) {
  EXPECT_THROW(parse("{ not json"), ConfigError);
  EXPECT_THROW(parse(R"({ "INSTANCES": {} })"), ConfigError);
  EXPECT_THROW(parse(R"({ "INSTANCES": { "redis": {} },
                          "DATABASES": { "X": { "id": 1, "instance": "other" } } })"), ConfigError);
  EXPECT_THROW(parse(R"({ "INSTANCES": { "redis": {} },
                          "DATABASES": { "X": { "id": 1, "separator": "||" } } })"), ConfigError);
}

TEST_F(DatabaseConfigTest, UnknownNamesAreConfigErrors) {
  DatabaseConfig config = DatabaseConfig::defaults();
  EXPECT_THROW(config.db_id("NO_SUCH_DB"), ConfigError);
  EXPECT_THROW(config.separator("NO_SUCH_DB"), ConfigError);
  EXPECT_THROW(config.instance("nowhere"), ConfigError);
}

TEST_F(DatabaseConfigTest, UnixSocketRequiresPath) {
  DatabaseConfig config = parse(CATALOGUE);
  EXPECT_THROW(config.endpoint("CHASSIS_APP_DB", true), ConfigError);
}

TEST_F(DatabaseConfigTest, ConnectorSettingsDefaults) {
  ConnectorSettings settings;
  EXPECT_EQ(settings.connect_retry_wait, std::chrono::seconds(10));
  EXPECT_EQ(settings.data_retrieval_wait, std::chrono::seconds(3));
  EXPECT_EQ(settings.notification_timeout, std::chrono::seconds(10));
  EXPECT_EQ(settings.maximum_data_wait, std::chrono::seconds(60));
  EXPECT_EQ(settings.error_threshold, 10);
  EXPECT_EQ(settings.error_suppression, 15);
  EXPECT_EQ(settings.scan_batch_size, 30u);
  EXPECT_EQ(settings.keyspace_events, "KEA");
  EXPECT_EQ(settings.keyspace_pattern, "__key*__:*");
}
