#pragma once

#include <string>

#include "config/config.pb.h"

namespace provenance::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. The result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static provenance::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error("Invalid configuration: ...") on the first problem found.
  static void Validate(const provenance::runtime::config::RuntimeConfig& config);
};

} // namespace provenance::config
