#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleetlink::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment overrides
  (BROKER_HOST, BROKER_PORT, BROKER_TLS, BROKER_USER, BROKER_PASS,
  MAP_SERVICE_API_KEY) are applied on top of the file.
*/
class ConfigLoader {
 public:
  static fleetlink::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironmentOverrides(fleetlink::runtime::config::RuntimeConfig& config);
};

} // namespace fleetlink::config
