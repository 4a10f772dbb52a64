#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace datahub::config {

using datahub::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kMiB = 1024ull * 1024ull;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings (tokens, numeric-looking names)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig Parse(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is an all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  auto* database = config.mutable_database();
  if (database->backend_case() == datahub::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_sqlite()->set_path("dataset-hub.db");
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(16);
  }

  auto* storage = config.mutable_storage();
  if (storage->root_uri().empty()) storage->set_root_uri("/tmp/dataset-hub");

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* quota = config.mutable_quota();
  if (quota->window() == datahub::runtime::config::QUOTA_WINDOW_UNSPECIFIED) {
    quota->set_window(datahub::runtime::config::QUOTA_WINDOW_ROLLING_24H);
  }
  if (quota->default_tier().empty()) quota->set_default_tier("free");
  if (quota->tiers_size() == 0) {
    auto* tier = quota->add_tiers();
    tier->set_name(quota->default_tier());
    tier->set_datasets_upload_per_day(10);
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->max_parts() == 0) ingest->set_max_parts(10000);
  if (ingest->max_part_size_bytes() == 0) ingest->set_max_part_size_bytes(5 * 1024 * kMiB);
  if (ingest->session_ttl_seconds() == 0) ingest->set_session_ttl_seconds(24 * 60 * 60);
  if (ingest->reaper_interval_seconds() == 0) ingest->set_reaper_interval_seconds(60);
  if (ingest->small_file_threshold_bytes() == 0) ingest->set_small_file_threshold_bytes(10 * kMiB);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is empty");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is empty");
  }

  std::set<std::string> tiers;
  for (const auto& tier : config.quota().tiers()) {
    if (tier.name().empty()) {
      throw std::runtime_error("Invalid configuration: quota tier without a name");
    }
    if (!tiers.insert(tier.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate quota tier " + tier.name());
    }
  }

  const auto& ingest = config.ingest();
  if (ingest.small_file_threshold_bytes() > ingest.max_part_size_bytes()) {
    throw std::runtime_error("Invalid configuration: ingest.small_file_threshold_bytes exceeds max_part_size_bytes");
  }
}

} // namespace datahub::config
