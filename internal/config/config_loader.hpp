#pragma once

#include <string>

#include "config/config.pb.h"

namespace digest::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Failures raise util::ConfigError.
*/
class ConfigLoader {
 public:
  static digest::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no file is given: every section at its defaults.
  static digest::runtime::config::RuntimeConfig Defaults();
};

} // namespace digest::config
