#pragma once

#include <string>

#include "cadence/config/v1/config.pb.h"

namespace cadence::config {

/*
  Loads RuntimeConfig / CommunitiesConfig from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. All failures throw util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static cadence::config::v1::RuntimeConfig     LoadFromYaml(const std::string& path);
  static cadence::config::v1::CommunitiesConfig LoadCommunitiesFromYaml(const std::string& path);

  // Environment overrides (CADENCE_ADMIN_PASSWORD) and defaults for unset knobs.
  static void ApplyDefaults(cadence::config::v1::RuntimeConfig& config);

  // Required fields for run-once / watch.
  static void ValidateForDispatch(const cadence::config::v1::RuntimeConfig& config);

  // Required fields for init-forum.
  static void ValidateForProvisioning(const cadence::config::v1::RuntimeConfig& config);
};

} // namespace cadence::config
