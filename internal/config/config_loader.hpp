#pragma once

#include <string>

#include "config/config.pb.h"

namespace telemetry::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; unset values are filled with their defaults.
*/
class ConfigLoader {
 public:
  static telemetry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static telemetry::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(telemetry::runtime::config::RuntimeConfig& config);
  static void Validate(const telemetry::runtime::config::RuntimeConfig& config);
};

} // namespace telemetry::config
