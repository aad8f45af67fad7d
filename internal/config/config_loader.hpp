#pragma once

#include <string>

#include "config/config.pb.h"

namespace imgvar::config {

inline constexpr const char* kDefaultUploadsRoot     = "./assets/uploads";
inline constexpr const char* kDefaultPublicPrefix    = "/assets/uploads";
inline constexpr uint32_t    kDefaultInlineThreshold = 200;

/*
  RuntimeConfig from YAML.

  The document goes YAML -> google.protobuf.Value -> JSON -> RuntimeConfig,
  so the proto schema is the only description of what is accepted.
  Unknown keys are an error.

  Load* fill unset storage/variant fields with the defaults above and then
  run Validate(). All failures are std::runtime_error.
*/
class ConfigLoader {
 public:
  static imgvar::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static imgvar::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(imgvar::runtime::config::RuntimeConfig& config);
  static void Validate(const imgvar::runtime::config::RuntimeConfig& config);
};

} // namespace imgvar::config
