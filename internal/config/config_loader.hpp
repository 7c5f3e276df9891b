#pragma once

#include <string>

#include "config/config.pb.h"

namespace voicecode::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled by ApplyDefaults so callers never see a zero timeout or limit.
*/
class ConfigLoader {
 public:
  static voicecode::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static voicecode::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static voicecode::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(voicecode::runtime::config::RuntimeConfig* config);
};

} // namespace voicecode::config
