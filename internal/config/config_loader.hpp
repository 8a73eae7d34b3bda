#pragma once

#include <string>

#include "config/config.pb.h"

namespace mirrorguard::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so
  unknown keys are rejected the same way protobuf rejects them.
  Missing optional values are filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static mirrorguard::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static mirrorguard::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(mirrorguard::runtime::config::RuntimeConfig& config);
};

} // namespace mirrorguard::config
