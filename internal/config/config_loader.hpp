#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace vigil::config {

/*
  Loads RuntimeConfig (backend) and AgentConfig (capture agent) from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so typos fail at startup instead of silently falling back to
  defaults.
*/
class ConfigLoader {
 public:
  static vigil::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static vigil::runtime::config::AgentConfig   LoadAgentFromYaml(const std::string& path);

  static void LoadInto(const std::string& path, google::protobuf::Message* message);
};

} // namespace vigil::config
