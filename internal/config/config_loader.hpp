#pragma once

#include <string>

#include "config/config.pb.h"

namespace recsync::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Throws std::runtime_error with the parser message.
*/
class ConfigLoader {
 public:
  static recsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static recsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace recsync::config
