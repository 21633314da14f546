#pragma once

#include <filesystem>
#include <string>

#include "internal/cache/backend.hpp"

namespace catalog::cache {

/*
  Plain cache layout.

    <dir>/cache/packages.json
    <dir>/cache/<package>_<channel>_<name>.json  (parts with "_" and "%" percent-escaped)
    <dir>/digest
*/
class JsonBackend final : public Backend {
 public:
  explicit JsonBackend(std::filesystem::path base);

  std::string_view Name() const override {
    return "json";
  }

  bool IsCachePresent() const override;
  void Init() override;
  void Open() override;
  void Close() override;

  v1::PackageIndex GetPackageIndex() const override;
  void             PutPackageIndex(const v1::PackageIndex& index) override;

  registry::v1::Bundle GetBundle(const BundleKey& key) const override;
  void                 PutBundle(const BundleKey& key, const registry::v1::Bundle& bundle) override;

  std::string GetDigest() const override;
  void        PutDigest(const std::string& digest) override;
  std::string ComputeDigest(const std::filesystem::path& source) const override;

  void SendBundles(const registry::BundleSender& send) const override;

 private:
  std::filesystem::path CacheDir() const {
    return base_ / "cache";
  }
  std::filesystem::path BundleFile(const BundleKey& key) const;

  std::filesystem::path base_;
};

} // namespace catalog::cache
