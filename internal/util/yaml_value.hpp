#pragma once

#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace catalog::util {

/*
  Converts a YAML document into a protobuf Value.

  Plain scalars become bools or numbers when they parse as such; quoted
  scalars always stay strings.
*/
void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// YAML document rendered as compact JSON.
std::string YamlToJson(const YAML::Node& node);

} // namespace catalog::util
