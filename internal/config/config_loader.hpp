#pragma once

#include <string>

#include "config/config.pb.h"
#include "config/manifest.pb.h"

namespace google::protobuf {
class Message;
}

namespace warehouse::config {

/*
  Loads RuntimeConfig and shift manifests from YAML files.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static warehouse::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static warehouse::runtime::manifest::Manifest LoadManifestFromYaml(const std::string& path);

  // Validates semantic constraints protobuf cannot express (positive sizes, unique ids).
  static void Validate(const warehouse::runtime::config::RuntimeConfig& config);
  static void Validate(const warehouse::runtime::manifest::Manifest& manifest);

 private:
  static void LoadMessage(const std::string& path, google::protobuf::Message* message);
};

} // namespace warehouse::config
