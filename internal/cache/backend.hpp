#pragma once

#include <google/protobuf/message.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "catalog/cache/v1/index.pb.h"
#include "catalog/registry/v1/registry.pb.h"
#include "internal/registry/query.hpp"

namespace catalog::cache {

struct BundleKey {
  std::string package;
  std::string channel;
  std::string name;
};

/*
  Storage of a built cache.

  A backend owns one layout below its base directory. PutBundle may be
  called from several build workers at once; everything else is called
  from one thread at a time.
*/
class Backend {
 public:
  virtual ~Backend() = default;

  virtual std::string_view Name() const = 0;

  // True when the base directory holds this backend's layout.
  virtual bool IsCachePresent() const = 0;

  // Discards any previous layout and opens an empty one.
  virtual void Init()  = 0;
  virtual void Open()  = 0;
  virtual void Close() = 0;

  virtual v1::PackageIndex GetPackageIndex() const                 = 0;
  virtual void             PutPackageIndex(const v1::PackageIndex&) = 0;

  virtual registry::v1::Bundle GetBundle(const BundleKey& key) const                           = 0;
  virtual void                 PutBundle(const BundleKey& key, const registry::v1::Bundle& bundle) = 0;

  virtual std::string GetDigest() const               = 0;
  virtual void        PutDigest(const std::string& digest) = 0;

  // Digest of the source catalog combined with the stored content.
  virtual std::string ComputeDigest(const std::filesystem::path& source) const = 0;

  virtual void SendBundles(const registry::BundleSender& send) const = 0;
};

// Picks the backend for dir. An empty or missing dir gets the compact backend.
std::unique_ptr<Backend> SelectBackend(const std::filesystem::path& dir);

// Rejects names that cannot be used as a key or file name component.
void ValidateKeyPart(const std::string& part);

// Writes bytes to path through a temporary file and a rename.
void WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes);

std::string ReadFileBytes(const std::filesystem::path& path);

// Binary protobuf with deterministic map ordering.
std::string SerializeDeterministic(const google::protobuf::Message& message);

// Bundles served in lists drop manifest content once a bundle path exists.
void TrimListedBundle(registry::v1::Bundle& bundle);

} // namespace catalog::cache
