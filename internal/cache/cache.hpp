#pragma once

#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/cache/backend.hpp"
#include "internal/cache/package_index.hpp"
#include "internal/registry/query.hpp"

namespace catalog::cache {

/*
  Query engine over a cache materialized from a declarative catalog.

  Owns its backend exclusively. Build and Load are not safe to run
  concurrently with queries; once loaded, queries are read-only.
*/
class Cache final : public registry::Query {
 public:
  explicit Cache(std::unique_ptr<Backend> backend);
  ~Cache() override;

  Cache(const Cache&)            = delete;
  Cache& operator=(const Cache&) = delete;

  const Backend& GetBackend() const {
    return *backend_;
  }

  // Throws util::IntegrityError when the stored digest does not match source.
  void CheckIntegrity(const std::filesystem::path& source);

  /*
    Rebuilds the cache from source.

    Metas are grouped by package, then converted and stored by
    `concurrency` workers, one per hardware thread when 0. The first
    failure or a stop request cancels the remaining work and fails the
    build. The stored content does not depend on the worker count.
  */
  void Build(const std::filesystem::path& source, std::stop_token stop = {}, unsigned concurrency = 0);

  void Load();

  // Loads the cache, rebuilding it first when it is stale.
  void LoadOrRebuild(const std::filesystem::path& source, unsigned concurrency = 0);

  std::vector<std::string> ListPackages() const override;
  registry::v1::Package GetPackage(const std::string& name) const override;
  registry::v1::Bundle GetBundle(const std::string& pkg, const std::string& channel, const std::string& csv_name) const override;
  registry::v1::Bundle GetBundleForChannel(const std::string& pkg, const std::string& channel) const override;
  registry::v1::Bundle GetBundleThatReplaces(const std::string& name, const std::string& pkg, const std::string& channel) const override;
  std::vector<registry::v1::ChannelEntry> GetChannelEntriesThatReplace(const std::string& name) const override;
  std::vector<registry::v1::ChannelEntry> GetChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const override;
  std::vector<registry::v1::ChannelEntry> GetLatestChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const override;
  void SendBundles(const registry::BundleSender& send) const override;

 private:
  bool Provides(const v1::IndexedBundle& bundle, const model::GroupVersionKind& gvk) const;
  const IndexedChannel& RequireChannel(const std::string& pkg, const std::string& channel) const;

  std::unique_ptr<Backend> backend_;
  PackageIndex             index_;
};

// Selects the backend for dir and opens it.
std::unique_ptr<Cache> Open(const std::filesystem::path& dir);

} // namespace catalog::cache
