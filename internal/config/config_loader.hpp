#pragma once

#include <string>

#include "config/config.pb.h"

namespace apphost::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static apphost::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static apphost::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace apphost::config
