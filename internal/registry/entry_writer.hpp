#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/model/bundle.hpp"

namespace catalog::registry {

// Replacement graph fields of a stored bundle row.
struct BundleRow {
  std::string              name;
  std::string              version;
  std::string              bundle_path;
  std::string              replaces;
  std::vector<std::string> skips;
  std::string              substitutes_for;
};

using ChannelRef = std::pair<std::string, std::string>; // (package, channel)

/*
  Unit of work over one open transaction.

  Exposes the typed insert/update/delete operations the loader needs.
  Statements are prepared once per writer and reset between rows.
*/
class EntryWriter {
 public:
  explicit EntryWriter(db::sqlite::SqliteTransaction& tx);

  EntryWriter(const EntryWriter&)            = delete;
  EntryWriter& operator=(const EntryWriter&) = delete;

  // bundles
  void InsertBundle(const model::Bundle& bundle, const std::string& manifest_json);
  std::optional<BundleRow> FindBundle(const std::string& name);
  std::optional<std::pair<std::string, std::string>> FindBundleByPath(const std::string& path);
  void InsertRelatedImage(const std::string& image, const std::string& bundle_name);
  void InsertProperty(const BundleRow& owner, const std::string& type, const std::string& value);
  void InsertDependency(const BundleRow& owner, const std::string& type, const std::string& value);
  void InsertProvidedApi(const BundleRow& owner, const model::GroupVersionKind& gvk);
  void InsertRequiredApi(const BundleRow& owner, const model::GroupVersionKind& gvk);
  void RedirectReplaces(const std::string& from, const std::string& to);
  void UpdateSkips(const std::string& name, const std::vector<std::string>& skips);
  std::vector<std::string> SubstitutionsFor(const std::string& name);

  // Deletes the bundle row and everything it owns, including its entries.
  void RemoveBundle(const std::string& name);
  std::vector<std::string> StrandedBundles();
  void ClearNonHeadManifests();

  // tombstones
  bool IsDeprecated(const std::string& name);
  void InsertDeprecated(const std::string& name);

  // packages and channels
  bool PackageExists(const std::string& name);
  void InsertPackage(const std::string& name);
  void SetDefaultChannel(const std::string& package, const std::string& channel);
  void InsertChannel(const std::string& name, const std::string& package, const std::string& head);
  void RemovePackageChannels(const std::string& package);
  std::vector<std::string> PackageBundleNames(const std::string& package);
  std::optional<ChannelRef> DefaultChannelHeadedBy(const std::string& bundle_name);
  void RemoveChannelsHeadedBy(const std::string& bundle_name);

  // channel entries
  int64_t InsertChannelEntry(const std::string& channel, const std::string& package, const std::string& bundle_name, int64_t depth);
  void LinkReplaces(int64_t entry_id, int64_t replaces_entry_id);
  std::vector<ChannelRef> Membership(const std::string& bundle_name);
  std::vector<std::string> Replacers(const std::string& bundle_name);
  void RemoveEntriesInChannel(const std::string& bundle_name, const ChannelRef& channel);
  void DetachReplaces(const std::string& bundle_name);

 private:
  db::sqlite::SqliteStatement& Prepared(const char* sql);
  void Run(const char* sql, const db::sql::Params& params);
  bool Exists(const char* sql, const db::sql::Params& params);
  std::vector<std::string> Strings(const char* sql, const db::sql::Params& params);

  db::sqlite::SqliteTransaction&                                      tx_;
  std::map<const char*, std::unique_ptr<db::sqlite::SqliteStatement>> statements_;
};

std::string JoinSkips(const std::vector<std::string>& skips);
std::vector<std::string> SplitSkips(const std::string& joined);

} // namespace catalog::registry
