#include "internal/model/properties.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "catalog/declcfg/v1/declcfg.pb.h"

namespace catalog::model {
namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    throw std::runtime_error("encode property value: " + std::string(status.message()));
  }
  return out;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("decode property value " + json + ": " + std::string(status.message()));
  }
  return message;
}

} // namespace

std::string GvkValue(const GroupVersionKind& gvk) {
  declcfg::v1::GvkProperty value;
  value.set_group(gvk.group);
  value.set_kind(gvk.kind);
  value.set_version(gvk.version);
  return ToJson(value);
}

GroupVersionKind ParseGvkValue(const std::string& json) {
  const auto value = FromJson<declcfg::v1::GvkProperty>(json);
  return GroupVersionKind{value.group(), value.version(), value.kind(), ""};
}

std::string PackageValue(const std::string& package_name, const std::string& version) {
  declcfg::v1::PackageProperty value;
  value.set_package_name(package_name);
  value.set_version(version);
  return ToJson(value);
}

void ParsePackageValue(const std::string& json, std::string* package_name, std::string* version) {
  const auto value = FromJson<declcfg::v1::PackageProperty>(json);
  if (package_name) *package_name = value.package_name();
  if (version) *version = value.version();
}

} // namespace catalog::model
