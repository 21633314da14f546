#include "internal/cache/json_backend.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/cache/digest.hpp"
#include "internal/declcfg/declcfg.hpp"
#include "internal/util/errors.hpp"

namespace catalog::cache {

namespace {

constexpr const char* kPackagesFile = "packages.json";

std::string ToJson(const google::protobuf::Message& message) {
  std::string                              out;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("encode " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  return out;
}

void FromJson(const std::filesystem::path& path, google::protobuf::Message* message) {
  auto status = google::protobuf::util::JsonStringToMessage(ReadFileBytes(path), message);
  if (!status.ok()) {
    throw std::runtime_error("decode " + path.string() + ": " + std::string(status.message()));
  }
}

// '_' joins the parts of a bundle file name, so it may not appear inside one.
std::string EscapeFilePart(const std::string& part) {
  std::string out;
  out.reserve(part.size());
  for (char c : part) {
    switch (c) {
      case '%': out += "%25"; break;
      case '_': out += "%5F"; break;
      default: out += c;
    }
  }
  return out;
}

std::vector<std::filesystem::path> SortedFiles(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

JsonBackend::JsonBackend(std::filesystem::path base) : base_(std::move(base)) {
}

bool JsonBackend::IsCachePresent() const {
  return std::filesystem::is_directory(CacheDir()) && std::filesystem::is_regular_file(base_ / "digest");
}

void JsonBackend::Init() {
  std::filesystem::remove_all(CacheDir());
  std::filesystem::remove(base_ / "digest");
  std::filesystem::create_directories(CacheDir());
}

void JsonBackend::Open() {
  if (!std::filesystem::is_directory(CacheDir())) {
    throw std::runtime_error("json cache directory " + CacheDir().string() + " not found");
  }
}

void JsonBackend::Close() {
}

std::filesystem::path JsonBackend::BundleFile(const BundleKey& key) const {
  ValidateKeyPart(key.package);
  ValidateKeyPart(key.channel);
  ValidateKeyPart(key.name);
  return CacheDir() / (EscapeFilePart(key.package) + "_" + EscapeFilePart(key.channel) + "_" + EscapeFilePart(key.name) + ".json");
}

v1::PackageIndex JsonBackend::GetPackageIndex() const {
  v1::PackageIndex index;
  FromJson(CacheDir() / kPackagesFile, &index);
  return index;
}

void JsonBackend::PutPackageIndex(const v1::PackageIndex& index) {
  WriteFileAtomic(CacheDir() / kPackagesFile, ToJson(index));
}

registry::v1::Bundle JsonBackend::GetBundle(const BundleKey& key) const {
  const auto path = BundleFile(key);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("no entry found for " + key.package + " " + key.channel + " " + key.name);
  }
  registry::v1::Bundle bundle;
  FromJson(path, &bundle);
  return bundle;
}

void JsonBackend::PutBundle(const BundleKey& key, const registry::v1::Bundle& bundle) {
  WriteFileAtomic(BundleFile(key), ToJson(bundle));
}

std::string JsonBackend::GetDigest() const {
  const auto path = base_ / "digest";
  if (!std::filesystem::exists(path)) {
    return {};
  }
  return ReadFileBytes(path);
}

void JsonBackend::PutDigest(const std::string& digest) {
  WriteFileAtomic(base_ / "digest", digest);
}

std::string JsonBackend::ComputeDigest(const std::filesystem::path& source) const {
  Sha256 hash;
  for (const auto& file : declcfg::ListCatalogFiles(source)) {
    hash.Field(std::filesystem::relative(file, source).generic_string());
    hash.Field(ReadFileBytes(file));
  }
  for (const auto& file : SortedFiles(CacheDir())) {
    hash.Field(file.filename().string());
    hash.Field(ReadFileBytes(file));
  }
  return hash.HexDigest();
}

void JsonBackend::SendBundles(const registry::BundleSender& send) const {
  for (const auto& file : SortedFiles(CacheDir())) {
    if (file.filename() == kPackagesFile) continue;
    registry::v1::Bundle bundle;
    FromJson(file, &bundle);
    TrimListedBundle(bundle);
    if (!send(bundle)) {
      return;
    }
  }
}

} // namespace catalog::cache
