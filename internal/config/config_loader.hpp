#pragma once

#include <string>

#include "config/config.pb.h"

namespace bazaar::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static bazaar::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static bazaar::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace bazaar::config
