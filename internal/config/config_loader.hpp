#pragma once

#include <string>

#include "config/config.pb.h"

namespace vigil::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  // LoadFromYaml + ApplyDefaults + Validate
  static vigil::runtime::config::RuntimeConfig Load(const std::string& path);

  static vigil::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset (zero) value with its default.
  static void ApplyDefaults(vigil::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidArgument naming the first inconsistent setting.
  static void Validate(const vigil::runtime::config::RuntimeConfig& config);
};

} // namespace vigil::config
