#pragma once

#include <string>

#include "config/config.pb.h"

namespace resolver::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to a protobuf Value, rendered as JSON, then parsed into
  RuntimeConfig. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static resolver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion on an in-memory document.
  static resolver::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace resolver::config
