#pragma once

#include <string>

#include "config/config.pb.h"

namespace ragturn::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. After parsing, RAGTURN_BIND_ADDRESS and RAGTURN_CHUNKS_PATH
  override their fields, and unset tuning values get their defaults.
*/
class ConfigLoader {
 public:
  static ragturn::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static ragturn::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(ragturn::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironment(ragturn::runtime::config::RuntimeConfig& config);
};

} // namespace ragturn::config
