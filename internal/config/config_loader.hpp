#pragma once

#include <string>

#include "config/config.pb.h"

namespace rulegraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown
  keys are rejected by the JSON parser. Semantic checks run after
  parsing (see Validate).
*/
class ConfigLoader {
 public:
  static rulegraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rulegraph::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error("Invalid configuration: ...")
  static void Validate(const rulegraph::runtime::config::RuntimeConfig& config);
};

} // namespace rulegraph::config
