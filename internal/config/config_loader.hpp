#pragma once

#include <string>

#include "config/config.pb.h"

namespace catalog::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. A config without
  a query source, or with an empty path for the chosen one, is rejected.
*/
class ConfigLoader {
 public:
  static catalog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static catalog::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace catalog::config
