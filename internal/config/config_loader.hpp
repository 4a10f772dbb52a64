#pragma once

#include <string>

#include "config/config.pb.h"

namespace datahub::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset values are filled with defaults before validation.
*/
class ConfigLoader {
 public:
  static datahub::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static datahub::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(datahub::runtime::config::RuntimeConfig& config);
  static void Validate(const datahub::runtime::config::RuntimeConfig& config);
};

} // namespace datahub::config
