#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobprobe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected, and so is anything Validate() refuses.
*/
class ConfigLoader {
 public:
  static jobprobe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static jobprobe::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws InputValidationError on the first problem found.
  static void Validate(const jobprobe::runtime::config::RuntimeConfig& config);
};

} // namespace jobprobe::config
