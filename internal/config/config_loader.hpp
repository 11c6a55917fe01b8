#pragma once

#include <string>

#include "config/config.pb.h"

namespace tending::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, and defaults are filled in for fields left unset.
*/
class ConfigLoader {
 public:
  static tending::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tending::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(tending::runtime::config::RuntimeConfig& config);
  static void Validate(const tending::runtime::config::RuntimeConfig& config);
};

} // namespace tending::config
