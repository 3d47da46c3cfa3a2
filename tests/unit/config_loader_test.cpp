#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "courier_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullNodeConfigParses() {
  const auto yaml_path = WriteYaml("full_node",
                                   R"(server:
  bind_address: "127.0.0.1:50061"
node:
  identity_path: "/var/lib/courier/identity.sealed"
  subscriptions: ["alerts", "weather"]
  trusted_peers: ["00ff"]
  default_ttl: "3600s"
  default_hop_limit: 12
  relay_only_subscribed: true
database:
  sqlite:
    path: "/var/lib/courier/bundles.db"
    wal_mode: true
store:
  capacity_bytes: 1048576
  max_payload_bytes: 65536
propagation:
  exchange_timeout: "5s"
  exchange_interval: "20s"
  retry_base: "1s"
  retry_max: "60s"
reaper:
  interval: "15s"
)");

  auto config = courier::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.node().subscriptions_size() == 2);
  assert(config.node().subscriptions(1) == "weather");
  assert(config.node().trusted_peers(0) == "00ff");
  assert(config.node().default_ttl().seconds() == 3600);
  assert(config.node().default_hop_limit() == 12);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.store().capacity_bytes() == 1048576);
  assert(config.propagation().exchange_interval().seconds() == 20);
  assert(config.reaper().interval().seconds() == 15);
}

void TestOptionsDerivedFromConfig() {
  auto config = courier::config::ConfigLoader::LoadFromString(R"(node:
  default_ttl: "60s"
  default_hop_limit: 5
  relay_only_subscribed: true
store:
  capacity_bytes: 4096
propagation:
  retry_base: "3s"
  max_frame_bytes: 8192
)");

  const auto store_options = courier::factory::StoreOptionsFrom(config);
  assert(store_options.capacity_bytes == 4096);
  assert(store_options.retry_base == std::chrono::seconds(3));
  assert(store_options.retry_max == std::chrono::minutes(10));

  const auto node_options = courier::factory::NodeOptionsFrom(config);
  assert(node_options.default_ttl == std::chrono::seconds(60));
  assert(node_options.default_hop_limit == 5);
  assert(!node_options.relay_all);
  assert(node_options.session.max_frame_bytes == 8192);
  assert(node_options.session.exchange_timeout == std::chrono::seconds(10));
}

void TestQuotedNumericScalarStaysString() {
  auto config = courier::config::ConfigLoader::LoadFromString(R"(node:
  trusted_peers: ["1234"]
  subscriptions: ["42"]
)");
  assert(config.node().trusted_peers(0) == "1234");
  assert(config.node().subscriptions(0) == "42");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = courier::config::ConfigLoader::LoadFromString("");
  assert(!config.has_node());
  assert(config.database().backend_case() == courier::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\courier\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = courier::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\courier\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)courier::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)courier::config::ConfigLoader::LoadFromYaml("/nonexistent/courier.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSampleConfigLoads() {
  const auto config = courier::config::ConfigLoader::LoadFromYaml(COURIER_SAMPLE_CONFIG);
  assert(config.database().has_sqlite());
  assert(config.node().subscriptions_size() == 3);
  assert(config.node().trusted_group_key_path().empty());

  const auto node_options = courier::factory::NodeOptionsFrom(config);
  assert(node_options.default_ttl == std::chrono::hours(24));
  assert(node_options.session.exchange_interval == std::chrono::seconds(30));

  const auto store_options = courier::factory::StoreOptionsFrom(config);
  assert(store_options.hard_capacity_bytes == 536870912);
}

bool RejectsAsInvalid(const std::string& yaml) {
  try {
    (void)courier::config::ConfigLoader::LoadFromString(yaml);
  } catch (const courier::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestInconsistentSettingsAreRejected() {
  assert(RejectsAsInvalid("node:\n  default_ttl: \"-5s\"\n"));
  assert(RejectsAsInvalid("node:\n  default_hop_limit: 70000\n"));
  assert(RejectsAsInvalid("store:\n  capacity_bytes: 4096\n  hard_capacity_bytes: 1024\n"));
  assert(RejectsAsInvalid("propagation:\n  retry_base: \"30s\"\n  retry_max: \"5s\"\n"));
  assert(RejectsAsInvalid("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(RejectsAsInvalid("node:\n  known_peers:\n    - node_id: \"ab\"\n"));
  assert(RejectsAsInvalid("propagation:\n  max_frame_bytes: 8\n"));
  assert(RejectsAsInvalid("propagation:\n  max_frame_bytes: 1023\n"));

  assert(!RejectsAsInvalid("store:\n  capacity_bytes: 1024\n  hard_capacity_bytes: 4096\n"));
  assert(!RejectsAsInvalid("propagation:\n  max_frame_bytes: 1024\n"));
}

} // namespace

int main() {
  TestFullNodeConfigParses();
  TestOptionsDerivedFromConfig();
  TestQuotedNumericScalarStaysString();
  TestEmptyDocumentGivesDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestInconsistentSettingsAreRejected();
  TestSampleConfigLoads();

  std::cout << "courier_unit_config_loader: pass\n";
  return 0;
}
