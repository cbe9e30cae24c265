#pragma once

#include <string>

#include "config/config.pb.h"

namespace swarm::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled from DefaultConfig().
*/
class ConfigLoader {
 public:
  static swarm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same, without defaults, so command-line overrides can be applied first.
  static swarm::runtime::config::RuntimeConfig ParseYaml(const std::string& path);
};

swarm::runtime::config::RuntimeConfig DefaultConfig();

// Fills every unset field of `config` with its default.
void ApplyDefaults(swarm::runtime::config::RuntimeConfig& config);

} // namespace swarm::config
