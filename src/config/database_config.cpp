#include "config/database_config.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace cfgdb {
namespace config {

namespace {

char to_separator(const std::string& text, const std::string& db_name) {
  if (text.size() != 1) {
    throw ConfigError("Separator of '" + db_name + "' must be a single character, got '" + text + "'");
  }
  return text[0];
}

} // namespace


//==============================================
// CONSTRUCTION
//==============================================

DatabaseConfig DatabaseConfig::load(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Database config: Loading " << path;

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Database config: Cannot open " << path;
    throw ConfigError("Cannot open database config file: " + path);
  }
  return parse(file);
}

DatabaseConfig DatabaseConfig::parse(std::istream& input) {
  namespace pt = boost::property_tree;

  DatabaseConfig config;
  try {
    pt::ptree root;
    pt::read_json(input, root);

    for (const auto& [name, node] : root.get_child("INSTANCES")) {
      InstanceInfo instance;
      instance.hostname = node.get<std::string>("hostname", instance.hostname);
      instance.port = node.get<std::uint16_t>("port", instance.port);
      instance.unix_socket_path = node.get<std::string>("unix_socket_path", "");
      config.add_instance(name, instance);
    }

    for (const auto& [name, node] : root.get_child("DATABASES")) {
      DatabaseInfo database;
      database.name = name;
      database.id = node.get<int>("id");
      database.separator = to_separator(node.get<std::string>("separator", "|"), name);
      database.instance = node.get<std::string>("instance", DEFAULT_INSTANCE);
      config.add_database(database);
    }
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Database config: Parse failure: " << e.what();
    throw ConfigError(std::string("Invalid database config: ") + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Database config: Loaded " << config.databases_.size()
                           << " databases on " << config.instances_.size() << " instances";
  return config;
}

DatabaseConfig DatabaseConfig::defaults() {
  DatabaseConfig config;

  InstanceInfo instance;
  instance.unix_socket_path = DEFAULT_UNIX_SOCKET_PATH;
  config.add_instance(DEFAULT_INSTANCE, instance);

  const std::vector<DatabaseInfo> databases = {
    {"APPL_DB",         0, ':', DEFAULT_INSTANCE},
    {"ASIC_DB",         1, ':', DEFAULT_INSTANCE},
    {"COUNTERS_DB",     2, ':', DEFAULT_INSTANCE},
    {"LOGLEVEL_DB",     3, ':', DEFAULT_INSTANCE},
    {"CONFIG_DB",       4, '|', DEFAULT_INSTANCE},
    {"PFC_WD_DB",       5, ':', DEFAULT_INSTANCE},
    {"FLEX_COUNTER_DB", 5, ':', DEFAULT_INSTANCE},
    {"STATE_DB",        6, '|', DEFAULT_INSTANCE},
    {"SNMP_OVERLAY_DB", 7, '|', DEFAULT_INSTANCE}
  };
  for (const auto& database : databases) {
    config.add_database(database);
  }
  return config;
}

void DatabaseConfig::add_instance(const std::string& name, const InstanceInfo& instance) {
  instances_[name] = instance;
}

void DatabaseConfig::add_database(const DatabaseInfo& database) {
  if (database.id < 0) {
    throw ConfigError("Database '" + database.name + "' has negative id");
  }
  if (instances_.count(database.instance) == 0) {
    throw ConfigError("Database '" + database.name + "' refers to unknown instance '" +
                      database.instance + "'");
  }
  databases_[database.name] = database;
}


//==============================================
// LOOKUPS
//==============================================

bool DatabaseConfig::has_database(const std::string& name) const {
  return databases_.count(name) > 0;
}

const DatabaseInfo& DatabaseConfig::database(const std::string& name) const {
  auto it = databases_.find(name);
  if (it == databases_.end()) {
    throw ConfigError("Unknown database '" + name + "'");
  }
  return it->second;
}

const InstanceInfo& DatabaseConfig::instance(const std::string& name) const {
  auto it = instances_.find(name);
  if (it == instances_.end()) {
    throw ConfigError("Unknown instance '" + name + "'");
  }
  return it->second;
}

int DatabaseConfig::db_id(const std::string& db_name) const {
  return database(db_name).id;
}

char DatabaseConfig::separator(const std::string& db_name) const {
  return database(db_name).separator;
}

redis::Endpoint DatabaseConfig::endpoint(const std::string& db_name, bool use_unix_socket) const {
  const InstanceInfo& info = instance(database(db_name).instance);

  redis::Endpoint endpoint;
  endpoint.host = info.hostname;
  endpoint.port = info.port;
  if (use_unix_socket) {
    if (info.unix_socket_path.empty()) {
      throw ConfigError("Instance of '" + db_name + "' has no unix socket path");
    }
    endpoint.unix_socket_path = info.unix_socket_path;
  }
  return endpoint;
}

std::vector<std::string> DatabaseConfig::database_names() const {
  std::vector<std::string> names;
  names.reserve(databases_.size());
  for (const auto& entry : databases_) {
    names.push_back(entry.first);
  }
  return names;
}

} // namespace config
} // namespace cfgdb
