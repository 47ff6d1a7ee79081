#pragma once

#include <string>

#include "config/config.pb.h"

namespace accessres::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset optional values are filled with defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static accessres::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static accessres::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Built-in configuration used when no file is given.
  static accessres::runtime::config::RuntimeConfig Defaults();

 private:
  static accessres::runtime::config::RuntimeConfig Parse(const std::string& json);
  static void                                   ApplyDefaults(accessres::runtime::config::RuntimeConfig* config);
  static void                                   Validate(const accessres::runtime::config::RuntimeConfig& config);
};

} // namespace accessres::config
