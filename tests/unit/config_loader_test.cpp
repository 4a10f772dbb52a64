#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/ingest/upload_session_manager.hpp"
#include "internal/quota/quota_guard.hpp"

namespace {

using datahub::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "dataset_hub_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromString("");

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "dataset-hub.db");
  assert(config.storage().root_uri() == "/tmp/dataset-hub");
  assert(config.logging().level() == "info");
  assert(config.quota().window() == datahub::runtime::config::QUOTA_WINDOW_ROLLING_24H);
  assert(config.quota().default_tier() == "free");
  assert(config.quota().tiers_size() == 1);
  assert(config.quota().tiers(0).datasets_upload_per_day() == 10);
  assert(config.ingest().max_parts() == 10000);
  assert(config.ingest().max_part_size_bytes() == 5ull * 1024 * 1024 * 1024);
  assert(config.ingest().session_ttl_seconds() == 86400);
  assert(config.ingest().small_file_threshold_bytes() == 10ull * 1024 * 1024);
}

void TestFullFileRoundTripsIntoOptions() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  postgres:
    connection_uri: "postgresql://hub@localhost/hub"
storage:
  root_uri: "s3://datasets/hub"
  s3:
    region: "eu-west-1"
    endpoint_override: "localhost:9000"
    scheme: "http"
logging:
  level: debug
quota:
  window: QUOTA_WINDOW_CALENDAR_DAY_UTC
  default_tier: dev
  tiers:
    - name: dev
      datasets_upload_per_day: 100
    - name: free
      datasets_upload_per_day: 3
ingest:
  max_parts: 500
  session_ttl_seconds: 120
  small_file_threshold_bytes: 1024
auth:
  tokens:
    "0123": alice
    "s3cr3t": bob
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 16);
  assert(config.storage().s3().region() == "eu-west-1");
  assert(config.logging().level() == "debug");

  // a quoted numeric-looking token stays a string key
  assert(config.auth().tokens().at("0123") == "alice");
  assert(config.auth().tokens().at("s3cr3t") == "bob");

  auto quota = datahub::quota::OptionsFromConfig(config.quota());
  assert(quota.window == datahub::runtime::config::QUOTA_WINDOW_CALENDAR_DAY_UTC);
  assert(quota.default_tier == "dev");
  assert(quota.tier_caps.at("dev") == 100);
  assert(quota.tier_caps.at("free") == 3);

  auto ingest = datahub::ingest::OptionsFromConfig(config.ingest());
  assert(ingest.chunk_policy.max_parts == 500);
  assert(ingest.session_ttl == std::chrono::seconds(120));
  assert(ingest.small_file_threshold == 1024);
}

void TestMemoryBackendIsSelectable() {
  auto config = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\hub\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\hub\\\"quoted\"\\db.sqlite");
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("quota:\n  tiers:\n    - name: free\n      datasets_upload_per_day: 1\n    - name: free\n      datasets_upload_per_day: 2\n"));
  assert(Rejects("quota:\n  tiers:\n    - datasets_upload_per_day: 1\n"));
  assert(Rejects("ingest:\n  max_part_size_bytes: 100\n  small_file_threshold_bytes: 200\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/dataset-hub.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileRoundTripsIntoOptions();
  TestMemoryBackendIsSelectable();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestInvalidConfigsAreRejected();

  std::cout << "dataset_hub_unit_config_loader: pass\n";
  return 0;
}
