#pragma once

#include <string>

#include "config/config.pb.h"

namespace ure::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Quoted scalars always stay strings, so `version: "1.0"` keeps
  its text.
*/
class ConfigLoader {
 public:
  static ure::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document.
  static ure::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace ure::config
