#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/yaml_value.hpp"

namespace catalog::config {

namespace {

using catalog::runtime::config::RuntimeConfig;

RuntimeConfig ParseNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  catalog::util::YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void Validate(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  switch (config.source_case()) {
    case RuntimeConfig::kSqlite:
      if (config.sqlite().path().empty()) {
        throw std::runtime_error("Invalid configuration: sqlite.path is required");
      }
      break;
    case RuntimeConfig::kCache:
      if (config.cache().dir().empty()) {
        throw std::runtime_error("Invalid configuration: cache.dir is required");
      }
      if (config.cache().catalog_dir().empty()) {
        throw std::runtime_error("Invalid configuration: cache.catalog_dir is required");
      }
      break;
    case RuntimeConfig::SOURCE_NOT_SET:
      throw std::runtime_error("Invalid configuration: one of sqlite or cache must be set");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseNode(yaml);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseNode(yaml);
  Validate(config);
  return config;
}

} // namespace catalog::config
