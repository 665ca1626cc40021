#pragma once

#include <string>

#include "config/config.pb.h"

namespace threadnet::config {

inline constexpr const char* kDefaultBindAddress       = "0.0.0.0:50061";
inline constexpr const char* kDefaultMeshcopService    = "_meshcop._udp.local.";
inline constexpr uint32_t    kDefaultResolveTimeoutMs  = 3000;
inline constexpr uint32_t    kDefaultSubscriberQueue   = 256;
inline constexpr uint32_t    kDefaultStreamPollMs      = 200;
inline constexpr const char* kDefaultServiceName       = "threadnet-manager";

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset values are filled with the defaults above; the database
  falls back to the in-memory backend.
*/
class ConfigLoader {
 public:
  static threadnet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static threadnet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(threadnet::runtime::config::RuntimeConfig* config);
};

} // namespace threadnet::config
