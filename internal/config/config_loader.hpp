#pragma once

#include <string>

#include "config/config.pb.h"

namespace resolver::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Every failure is reported as util::ConfigError.
*/
class ConfigLoader {
 public:
  static resolver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static resolver::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace resolver::config
