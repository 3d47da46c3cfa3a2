#pragma once

#include <string>

#include "config/config.pb.h"

namespace courier::config {

/*
  Loads the node's RuntimeConfig from YAML.

  The YAML tree is mapped onto google.protobuf.Value, rendered as JSON and
  parsed into the generated message: unknown keys are errors and durations
  take the protobuf string form ("30s"). The result is validated before it
  is returned.
*/
class ConfigLoader {
 public:
  static courier::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static courier::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Cross-field checks the schema cannot express. Throws util::InvalidArgument.
  static void Validate(const courier::runtime::config::RuntimeConfig& config);
};

} // namespace courier::config
