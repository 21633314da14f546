#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/bundle.hpp"
#include "internal/model/package.hpp"

namespace catalog::registry {

class EntryWriter;

struct LoaderOptions {
  // gates SubstitutesFor
  bool enable_alpha = false;
};

/*
  Persists bundles and channel graphs into the relational store.

  Every public operation runs in its own transaction and either commits
  fully or leaves the store untouched. Structural graph problems of a
  package are collected across its channels and raised together as
  util::AggregateError; SQL failures raise db::DatabaseError.

  The schema is migrated to the latest version on construction.
*/
class SqlLoader {
 public:
  explicit SqlLoader(std::shared_ptr<db::sqlite::SqliteDB> db, LoaderOptions options = {});

  void AddBundle(const model::Bundle& bundle);
  void AddPackageChannels(const model::PackageManifest& manifest);
  void AddBundlePackageChannels(const model::PackageManifest& manifest, const model::Bundle& bundle);

  // Rewrites the package's channels from a graph produced by the graph
  // loader. Each channel walk must cover every real node of its graph.
  void AddPackageChannelsFromGraph(const model::Package& graph);

  void DeprecateBundle(const std::string& bundle_path);
  void RemovePackage(const std::string& package_name);
  void RemoveStrandedBundles();

  // Drops manifest content of every bundle that does not head a channel.
  void ClearNonHeadBundles();

  const std::shared_ptr<db::sqlite::SqliteDB>& DB() const {
    return db_;
  }

 private:
  struct WalkResult {
    std::optional<std::string> error;
    int64_t                    terminal_depth = 0;
  };

  void AddBundle(EntryWriter& writer, const model::Bundle& bundle);
  void AddSubstitutesFor(EntryWriter& writer, const model::Bundle& bundle);
  void AddPackageChannels(EntryWriter& writer, const model::PackageManifest& manifest);
  WalkResult WalkChannel(EntryWriter& writer, const std::string& package, const std::string& channel, const std::string& head);
  void RemovePackage(EntryWriter& writer, const std::string& package_name);
  void RemoveStrandedBundles(EntryWriter& writer);
  void DeprecateBundle(EntryWriter& writer, const std::string& bundle_path);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  LoaderOptions                         options_;
};

} // namespace catalog::registry
