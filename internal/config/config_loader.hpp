#pragma once

#include <string>

#include "config/config.pb.h"

namespace timekeeper::config {

inline constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
inline constexpr const char* kDefaultStorePath       = "data/storage.json";
inline constexpr unsigned    kDefaultUpdateIntervalMs = 1000;
inline constexpr unsigned    kDefaultAccuracySeconds  = 2;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing sections get defaults, then TIMEKEEPER_STORE_PATH
  replaces the configured store path.
*/
class ConfigLoader {
 public:
  static timekeeper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static timekeeper::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(timekeeper::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironmentOverrides(timekeeper::runtime::config::RuntimeConfig& config);
  static void Validate(const timekeeper::runtime::config::RuntimeConfig& config);
};

} // namespace timekeeper::config
