#pragma once

#include <string>

#include "config/config.pb.h"

namespace glucolumin::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Zero-valued numeric fields receive defaults, then the result
  is checked for semantic consistency.
*/
class ConfigLoader {
 public:
  static glucolumin::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static glucolumin::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);

  static void ApplyDefaults(glucolumin::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error("Invalid configuration: ...").
  static void Validate(const glucolumin::runtime::config::RuntimeConfig& config);
};

} // namespace glucolumin::config
