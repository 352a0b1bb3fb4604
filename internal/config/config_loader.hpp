#pragma once

#include <string>

#include "config/config.pb.h"

namespace tuplestore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static tuplestore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tuplestore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Throws util::InvalidConfig on values the datastore cannot run with.
void Validate(const tuplestore::runtime::config::RuntimeConfig& config);

} // namespace tuplestore::config
