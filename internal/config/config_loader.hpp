#pragma once

#include <string>

#include "config/config.pb.h"

namespace shakemap::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled with service defaults and the result is validated, so callers
  never see a config the server cannot start with.
*/
class ConfigLoader {
 public:
  static shakemap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(shakemap::runtime::config::RuntimeConfig& config);
  static void Validate(const shakemap::runtime::config::RuntimeConfig& config);
};

} // namespace shakemap::config
