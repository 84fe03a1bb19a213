#pragma once

#include <string>

#include "config/config.pb.h"

namespace actions::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static actions::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace actions::config
