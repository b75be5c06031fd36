#pragma once

#include <string>

#include "config/config.pb.h"

namespace purchase::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in afterwards and the result validated.
*/
class ConfigLoader {
 public:
  static purchase::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset durations, prefixes and paging with their defaults.
  static void ApplyDefaults(purchase::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error("Invalid configuration: ...") on the first problem.
  static void Validate(const purchase::runtime::config::RuntimeConfig& config);
};

} // namespace purchase::config
