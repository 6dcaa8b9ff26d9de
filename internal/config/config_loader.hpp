#pragma once

#include <string>

#include "config/config.pb.h"

namespace receiver::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing values are filled with defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static receiver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static receiver::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(receiver::runtime::config::RuntimeConfig& config);
  static void Validate(const receiver::runtime::config::RuntimeConfig& config);
};

} // namespace receiver::config
