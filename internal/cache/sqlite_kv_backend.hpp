#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/cache/backend.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace catalog::cache {

/*
  Compact cache layout.

    <dir>/kv.v1/db       SQLite table kv(key, value)
    <dir>/kv.v1/digest

  Keys are "packages.json" and "bundles/<package>/<channel>/<name>";
  values are binary protobuf.
*/
class SqliteKvBackend final : public Backend {
 public:
  explicit SqliteKvBackend(std::filesystem::path base);

  std::string_view Name() const override {
    return "compact";
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
  std::filesystem::path Root() const {
    return base_ / "kv.v1";
  }

  void                       Put(const std::string& key, const std::string& value);
  std::optional<std::string> Get(const std::string& key) const;
  db::sqlite::SqliteDB&      DB() const;

  std::filesystem::path                 base_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;
  mutable std::mutex                    mutex_;
};

} // namespace catalog::cache
