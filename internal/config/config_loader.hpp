#pragma once

#include <string>

#include "config/config.pb.h"

namespace stowage::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset numeric
  fields are filled from the built-in defaults, then the result is
  validated; both steps throw std::runtime_error on failure.
*/
class ConfigLoader {
 public:
  static stowage::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults only; used when no config file is given.
  static stowage::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(stowage::runtime::config::RuntimeConfig* config);
  static void Validate(const stowage::runtime::config::RuntimeConfig& config);
};

} // namespace stowage::config
