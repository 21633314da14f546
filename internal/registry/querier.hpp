#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/bundle.hpp"
#include "internal/model/package.hpp"
#include "internal/registry/query.hpp"

namespace catalog::db::sqlite {
class SqliteStatement;
}

namespace catalog::registry {

struct ChannelHead {
  std::string package_name;
  std::string channel_name;
  std::string head;
};

/*
  Query implementation over the relational store.

  Read-only. Every call prepares its own statements, so one querier can
  be shared by concurrent callers.
*/
class SqlQuerier final : public Query {
 public:
  explicit SqlQuerier(std::shared_ptr<db::sqlite::SqliteDB> db);

  std::vector<std::string> ListPackages() const override;
  v1::Package GetPackage(const std::string& name) const override;
  v1::Bundle GetBundle(const std::string& pkg, const std::string& channel, const std::string& csv_name) const override;
  v1::Bundle GetBundleForChannel(const std::string& pkg, const std::string& channel) const override;
  v1::Bundle GetBundleThatReplaces(const std::string& name, const std::string& pkg, const std::string& channel) const override;
  std::vector<v1::ChannelEntry> GetChannelEntriesThatReplace(const std::string& name) const override;
  std::vector<v1::ChannelEntry> GetChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const override;
  std::vector<v1::ChannelEntry> GetLatestChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const override;
  void SendBundles(const BundleSender& send) const override;

  // maintenance reads
  std::vector<ChannelHead> ListChannels() const;
  std::string GetDefaultChannelForPackage(const std::string& pkg) const;
  std::string GetCurrentCSVNameForChannel(const std::string& pkg, const std::string& channel) const;
  std::vector<std::string> GetBundlePathsForPackage(const std::string& pkg) const;
  std::vector<std::string> ListImages() const;
  std::vector<std::string> GetImagesForBundle(const std::string& csv_name) const;
  std::pair<std::vector<model::GroupVersionKind>, std::vector<model::GroupVersionKind>> GetApisForEntry(int64_t entry_id) const;
  std::vector<model::Dependency> GetDependenciesForBundle(const std::string& csv_name) const;
  std::vector<model::Property> GetPropertiesForBundle(const std::string& csv_name) const;
  std::vector<model::AnnotatedChannelEntry> GetChannelEntriesFromPackage(const std::string& pkg) const;
  std::set<model::BundleKey> GetBundlesForPackage(const std::string& pkg) const;

  // (name, version) of the bundle stored under an image reference
  std::optional<std::pair<std::string, std::string>> GetBundleNameAndVersionForImage(const std::string& path) const;

 private:
  bool PackageExists(const std::string& pkg) const;
  v1::Bundle ReadBundle(const db::sqlite::SqliteStatement& stmt, int first_column, const std::string& pkg, const std::string& channel) const;
  std::vector<model::GroupVersionKind> Apis(const char* sql, const std::string& csv_name) const;

  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace catalog::registry
