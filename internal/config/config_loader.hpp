#pragma once

#include <string>

#include "config/config.pb.h"

namespace rdsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static rdsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rdsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace rdsync::config
