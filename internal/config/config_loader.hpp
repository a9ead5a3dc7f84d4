#pragma once

#include <string>

#include "config/config.pb.h"

namespace renderplan::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left unset
  in the file are filled from Defaults().
*/
class ConfigLoader {
 public:
  static renderplan::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static renderplan::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static renderplan::runtime::config::RuntimeConfig Defaults();
};

} // namespace renderplan::config
