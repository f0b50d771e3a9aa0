#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskpilot::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Fields left unset are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static taskpilot::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static taskpilot::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(taskpilot::runtime::config::RuntimeConfig& config);
};

} // namespace taskpilot::config
