#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace circulation::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Durations use the protobuf JSON form ("30s", "0.020s").
*/
class ConfigLoader {
 public:
  static circulation::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static circulation::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static circulation::runtime::config::RuntimeConfig FromNode(const YAML::Node& node);
};

} // namespace circulation::config
