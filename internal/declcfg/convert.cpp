#include "internal/declcfg/convert.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <openssl/evp.h>

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>

#include "catalog/declcfg/v1/declcfg.pb.h"
#include "internal/model/properties.hpp"
#include "internal/util/errors.hpp"

namespace catalog::declcfg {

namespace {

constexpr std::string_view kBundleObjectType      = "olm.bundle.object";
constexpr std::string_view kPackageRequiredType   = "olm.package.required";
constexpr std::string_view kClusterServiceVersion = "ClusterServiceVersion";

template <typename Message>
Message Parse(std::string_view blob) {
  Message message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(blob), &message, options);
  if (!status.ok()) {
    throw std::runtime_error("parse meta: " + std::string(status.message()));
  }
  return message;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(message, &out);
  if (!status.ok()) {
    throw std::runtime_error("encode json: " + std::string(status.message()));
  }
  return out;
}

// Line breaks and surrounding whitespace in the payload are skipped.
std::string Base64Decode(const std::string& encoded) {
  if (encoded.empty()) return {};
  std::unique_ptr<EVP_ENCODE_CTX, decltype(&EVP_ENCODE_CTX_free)> ctx(EVP_ENCODE_CTX_new(), &EVP_ENCODE_CTX_free);
  if (!ctx) {
    throw std::runtime_error("allocate base64 decoder");
  }
  EVP_DecodeInit(ctx.get());

  std::string out(encoded.size(), '\0');
  int         written = 0;
  int         tail    = 0;
  auto*       buffer  = reinterpret_cast<unsigned char*>(out.data());
  if (EVP_DecodeUpdate(ctx.get(), buffer, &written, reinterpret_cast<const unsigned char*>(encoded.data()), static_cast<int>(encoded.size())) < 0 ||
      EVP_DecodeFinal(ctx.get(), buffer + written, &tail) < 0) {
    throw std::runtime_error("invalid base64 in bundle object");
  }
  out.resize(static_cast<std::size_t>(written + tail));
  return out;
}

bool IsCsv(const std::string& object_json) {
  google::protobuf::Struct object;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(object_json, &object, options).ok()) {
    return false;
  }
  auto it = object.fields().find("kind");
  return it != object.fields().end() && it->second.string_value() == kClusterServiceVersion;
}

void SetGvk(const model::GroupVersionKind& gvk, registry::v1::GroupVersionKind* out) {
  out->set_group(gvk.group);
  out->set_version(gvk.version);
  out->set_kind(gvk.kind);
}

// Fields shared by every channel entry of the same bundle.
registry::v1::Bundle BundleTemplate(const v1::Bundle& meta) {
  registry::v1::Bundle bundle;
  bundle.set_csv_name(meta.name());
  bundle.set_package_name(meta.package());
  bundle.set_bundle_path(meta.image());

  for (const auto& property : meta.properties()) {
    const std::string value = ToJson(property.value());

    if (property.type() == model::kPackageType) {
      std::string version;
      model::ParsePackageValue(value, nullptr, &version);
      bundle.set_version(version);
    } else if (property.type() == model::kGvkType) {
      SetGvk(model::ParseGvkValue(value), bundle.add_provided_apis());
    } else if (property.type() == model::kGvkRequiredType) {
      const auto gvk = model::ParseGvkValue(value);
      SetGvk(gvk, bundle.add_required_apis());
      auto* dependency = bundle.add_dependencies();
      dependency->set_type(std::string(model::kGvkType));
      dependency->set_value(model::GvkValue(gvk));
    } else if (property.type() == kPackageRequiredType) {
      auto* dependency = bundle.add_dependencies();
      dependency->set_type(std::string(model::kPackageType));
      dependency->set_value(value);
    } else if (property.type() == kBundleObjectType) {
      const auto& fields = property.value().struct_value().fields();
      auto        data   = fields.find("data");
      if (data == fields.end()) {
        throw std::runtime_error("bundle " + meta.name() + ": olm.bundle.object without data");
      }
      auto object = Base64Decode(data->second.string_value());
      if (bundle.csv_json().empty() && IsCsv(object)) {
        bundle.set_csv_json(object);
      }
      bundle.add_object(std::move(object));
      continue;
    }

    auto* out = bundle.add_properties();
    out->set_type(property.type());
    out->set_value(property.type() == model::kGvkType ? model::GvkValue(model::ParseGvkValue(value)) : value);
  }
  return bundle;
}

std::string FindHead(const v1::Channel& channel) {
  std::set<std::string> candidates;
  std::set<std::string> replaced;
  for (const auto& entry : channel.entries()) {
    candidates.insert(entry.name());
    if (!entry.replaces().empty()) replaced.insert(entry.replaces());
    replaced.insert(entry.skips().begin(), entry.skips().end());
  }
  for (const auto& name : replaced) {
    candidates.erase(name);
  }
  if (candidates.empty()) {
    throw util::GraphError("no channel head found in graph for channel " + channel.name());
  }
  if (candidates.size() > 1) {
    std::string names;
    for (const auto& name : candidates) {
      if (!names.empty()) names += ", ";
      names += name;
    }
    throw util::GraphError("multiple candidate channel heads found for channel " + channel.name() + ": " + names);
  }
  return *candidates.begin();
}

} // namespace

PackageModel ConvertPackage(const std::string& package, const std::vector<std::string_view>& blobs) {
  std::optional<v1::Package>             package_meta;
  std::map<std::string, v1::Channel>     channels;
  std::map<std::string, registry::v1::Bundle> bundles;

  for (const auto blob : blobs) {
    const auto header = Parse<v1::Meta>(blob);
    if (header.schema() == model::kSchemaPackage) {
      if (package_meta) {
        throw util::GraphError("package " + package + " declared more than once");
      }
      package_meta = Parse<v1::Package>(blob);
    } else if (header.schema() == model::kSchemaChannel) {
      auto channel = Parse<v1::Channel>(blob);
      if (!channels.emplace(channel.name(), channel).second) {
        throw util::GraphError("channel " + channel.name() + " of package " + package + " declared more than once");
      }
    } else if (header.schema() == model::kSchemaBundle) {
      const auto meta = Parse<v1::Bundle>(blob);
      if (!bundles.emplace(meta.name(), BundleTemplate(meta)).second) {
        throw util::GraphError("bundle " + meta.name() + " of package " + package + " declared more than once");
      }
    }
  }

  if (!package_meta) {
    throw util::GraphError("package " + package + " has no " + std::string(model::kSchemaPackage) + " meta");
  }
  if (!channels.contains(package_meta->default_channel())) {
    throw util::GraphError("default channel " + package_meta->default_channel() + " of package " + package + " not found");
  }

  PackageModel result;
  auto&        index = result.index;
  index.set_name(package);
  index.set_description(package_meta->description());
  index.set_default_channel(package_meta->default_channel());
  if (package_meta->has_icon()) {
    index.mutable_icon()->set_base64data(package_meta->icon().base64data());
    index.mutable_icon()->set_mediatype(package_meta->icon().mediatype());
  }

  // std::map keeps channels and bundles in name order
  for (const auto& [name, channel] : channels) {
    auto* indexed = index.add_channels();
    indexed->set_name(name);
    indexed->set_head(FindHead(channel));

    std::vector<const v1::ChannelEntry*> entries;
    for (const auto& entry : channel.entries()) entries.push_back(&entry);
    std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) { return a->name() < b->name(); });

    for (const auto* entry : entries) {
      auto found = bundles.find(entry->name());
      if (found == bundles.end()) {
        throw util::GraphError("bundle " + entry->name() + " referenced by channel " + name + " of package " + package + " not found");
      }

      auto* node = indexed->add_bundles();
      node->set_package(package);
      node->set_channel(name);
      node->set_name(entry->name());
      node->set_replaces(entry->replaces());
      for (const auto& skip : entry->skips()) node->add_skips(skip);

      auto bundle = found->second;
      bundle.set_channel_name(name);
      bundle.set_skip_range(entry->skip_range());
      bundle.set_replaces(entry->replaces());
      for (const auto& skip : entry->skips()) bundle.add_skips(skip);
      result.bundles.push_back(std::move(bundle));
    }
  }
  return result;
}

} // namespace catalog::declcfg
