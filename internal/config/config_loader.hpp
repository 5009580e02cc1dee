#pragma once

#include <string>

#include "config/config.pb.h"

namespace engram::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON and parsed into
  RuntimeConfig. Unknown keys are rejected. Unset sections receive the
  documented defaults (ram objects, memory database, branch "main").
*/
class ConfigLoader {
 public:
  static engram::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static engram::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(engram::runtime::config::RuntimeConfig& config);
};

} // namespace engram::config
