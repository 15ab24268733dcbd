#pragma once

#include <string>

#include "config/config.pb.h"

namespace shipx::config {

inline constexpr const char* kSandboxBaseUrl = "https://sandbox-api-shipx-pl.easypack24.net/v1";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static shipx::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset value with the built-in default. Values already present
  // are kept.
  static void ApplyDefaults(shipx::runtime::config::RuntimeConfig* config);
};

} // namespace shipx::config
