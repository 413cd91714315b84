#pragma once

#include <string>

#include "config/config.pb.h"

namespace deploy::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; missing keys take the defaults below.
*/
class ConfigLoader {
 public:
  static deploy::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static deploy::runtime::config::RuntimeConfig Defaults();

  // Fills every unset field with its default. Set fields are left alone.
  static void ApplyDefaults(deploy::runtime::config::RuntimeConfig& config);
};

} // namespace deploy::config
