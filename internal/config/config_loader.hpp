#pragma once

#include <string>

#include "config/config.pb.h"

namespace debugpod::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults fill fields the
  file leaves out, DEBUGPOD_* environment variables override the file, and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static debugpod::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(debugpod::runtime::config::RuntimeConfig* config);
  static void ApplyEnvironmentOverrides(debugpod::runtime::config::RuntimeConfig* config);
  static void Validate(const debugpod::runtime::config::RuntimeConfig& config);
};

} // namespace debugpod::config
