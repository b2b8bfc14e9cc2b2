#pragma once

#include <string>

#include "config/config.pb.h"

namespace launcher::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so field names in the
  file match config.proto.
*/
class ConfigLoader {
 public:
  static launcher::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static launcher::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Agent settings from KOLIDE_LAUNCHER_* variables take precedence over the
  // file: HOSTNAME, INSECURE, INSECURE_TRANSPORT, ENROLL_SECRET and
  // ENROLL_SECRET_PATH. Booleans that fail to parse are ignored.
  static void ApplyEnvironmentOverrides(launcher::runtime::config::RuntimeConfig* config);
};

// Whole file contents. Throws util::InvalidArgument naming what was being read.
std::string ReadFileContents(const std::string& path, const std::string& what);

} // namespace launcher::config
