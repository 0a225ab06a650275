#pragma once

#include <string>

#include "config/config.pb.h"

namespace shopfloor::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown and
  duplicate keys are rejected so a typo in a section name fails at startup.
  SHOPFLOOR_BIND_ADDRESS and SHOPFLOOR_SQLITE_PATH override the file.
*/
class ConfigLoader {
 public:
  static shopfloor::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static shopfloor::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace shopfloor::config
