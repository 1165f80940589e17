#pragma once

#include <string>

#include "config/config.pb.h"

namespace staging::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, rendered as JSON and parsed into
  RuntimeConfig with unknown fields rejected. The parsed config is then
  checked for values that cannot be defaulted away.
*/
class ConfigLoader {
 public:
  static staging::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static staging::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error naming the first offending field.
  static void Validate(const staging::runtime::config::RuntimeConfig& config);
};

} // namespace staging::config
