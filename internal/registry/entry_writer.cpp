#include "internal/registry/entry_writer.hpp"

#include <sstream>

#include "internal/db/sql/sql_queries.hpp"

namespace catalog::registry {

using db::sqlite::SqliteStatement;
namespace sql = db::sql;

namespace {

db::sql::Param NullIfEmpty(const std::string& value) {
  if (value.empty()) return nullptr;
  return value;
}

} // namespace

std::string JoinSkips(const std::vector<std::string>& skips) {
  std::string out;
  for (const auto& skip : skips) {
    if (skip.empty()) continue;
    if (!out.empty()) out += ",";
    out += skip;
  }
  return out;
}

std::vector<std::string> SplitSkips(const std::string& joined) {
  std::vector<std::string> out;
  std::stringstream        in(joined);
  std::string              item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

EntryWriter::EntryWriter(db::sqlite::SqliteTransaction& tx) : tx_(tx) {
}

SqliteStatement& EntryWriter::Prepared(const char* sql) {
  auto it = statements_.find(sql);
  if (it == statements_.end()) {
    it = statements_.emplace(sql, std::make_unique<SqliteStatement>(tx_.DB(), sql)).first;
  } else {
    it->second->Reset();
  }
  return *it->second;
}

void EntryWriter::Run(const char* sql, const db::sql::Params& params) {
  auto& stmt = Prepared(sql);
  stmt.Bind(params);
  stmt.Run();
}

bool EntryWriter::Exists(const char* sql, const db::sql::Params& params) {
  auto& stmt = Prepared(sql);
  stmt.Bind(params);
  return stmt.Step();
}

std::vector<std::string> EntryWriter::Strings(const char* sql, const db::sql::Params& params) {
  auto& stmt = Prepared(sql);
  stmt.Bind(params);
  std::vector<std::string> out;
  while (stmt.Step()) {
    out.push_back(stmt.Text(0));
  }
  return out;
}

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

void EntryWriter::InsertBundle(const model::Bundle& bundle, const std::string& manifest_json) {
  Run(sql::INSERT_BUNDLE, {bundle.name, NullIfEmpty(bundle.csv_json), NullIfEmpty(manifest_json), bundle.bundle_path, bundle.version,
                           bundle.skip_range, bundle.replaces, JoinSkips(bundle.skips), bundle.substitutes_for});
}

std::optional<BundleRow> EntryWriter::FindBundle(const std::string& name) {
  auto& stmt = Prepared(sql::SELECT_BUNDLE_GRAPH_FIELDS);
  stmt.Bind({name});
  if (!stmt.Step()) {
    return std::nullopt;
  }
  BundleRow row;
  row.name            = stmt.Text(0);
  row.version         = stmt.Text(1);
  row.bundle_path     = stmt.Text(2);
  row.replaces        = stmt.Text(3);
  row.skips           = SplitSkips(stmt.Text(4));
  row.substitutes_for = stmt.Text(5);
  return row;
}

std::optional<std::pair<std::string, std::string>> EntryWriter::FindBundleByPath(const std::string& path) {
  auto& stmt = Prepared(sql::SELECT_BUNDLE_BY_PATH);
  stmt.Bind({path});
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return std::make_pair(stmt.Text(0), stmt.Text(1));
}

void EntryWriter::InsertRelatedImage(const std::string& image, const std::string& bundle_name) {
  Run(sql::INSERT_RELATED_IMAGE, {image, bundle_name});
}

void EntryWriter::InsertProperty(const BundleRow& owner, const std::string& type, const std::string& value) {
  if (Exists(sql::SELECT_PROPERTY_EXISTS, {type, value, owner.name})) {
    return;
  }
  Run(sql::INSERT_PROPERTY, {type, value, owner.name, owner.version, owner.bundle_path});
}

void EntryWriter::InsertDependency(const BundleRow& owner, const std::string& type, const std::string& value) {
  if (Exists(sql::SELECT_DEPENDENCY_EXISTS, {type, value, owner.name})) {
    return;
  }
  Run(sql::INSERT_DEPENDENCY, {type, value, owner.name, owner.version, owner.bundle_path});
}

void EntryWriter::InsertProvidedApi(const BundleRow& owner, const model::GroupVersionKind& gvk) {
  Run(sql::INSERT_API, {gvk.group, gvk.version, gvk.kind, gvk.plural});
  Run(sql::INSERT_API_PROVIDER, {gvk.group, gvk.version, gvk.kind, owner.name, owner.version, owner.bundle_path});
}

void EntryWriter::InsertRequiredApi(const BundleRow& owner, const model::GroupVersionKind& gvk) {
  Run(sql::INSERT_API, {gvk.group, gvk.version, gvk.kind, gvk.plural});
  Run(sql::INSERT_API_REQUIRER, {gvk.group, gvk.version, gvk.kind, owner.name, owner.version, owner.bundle_path});
}

void EntryWriter::RedirectReplaces(const std::string& from, const std::string& to) {
  Run(sql::UPDATE_BUNDLE_REPLACES_FROM, {to, from, to});
}

void EntryWriter::UpdateSkips(const std::string& name, const std::vector<std::string>& skips) {
  Run(sql::UPDATE_BUNDLE_SKIPS, {JoinSkips(skips), name});
}

std::vector<std::string> EntryWriter::SubstitutionsFor(const std::string& name) {
  return Strings(sql::SELECT_SUBSTITUTIONS_FOR, {name});
}

void EntryWriter::RemoveBundle(const std::string& name) {
  Run(sql::NULL_REPLACES_INTO_BUNDLE, {name});
  Run(sql::DELETE_BUNDLE_ENTRIES, {name});
  Run(sql::DELETE_BUNDLE_IMAGES, {name});
  Run(sql::DELETE_BUNDLE_PROPERTIES, {name});
  Run(sql::DELETE_BUNDLE_DEPS, {name});
  Run(sql::DELETE_BUNDLE_PROVIDED, {name});
  Run(sql::DELETE_BUNDLE_REQUIRED, {name});
  Run(sql::DELETE_BUNDLE, {name});
}

std::vector<std::string> EntryWriter::StrandedBundles() {
  return Strings(sql::SELECT_STRANDED_BUNDLES, {});
}

void EntryWriter::ClearNonHeadManifests() {
  Run(sql::CLEAR_NON_HEAD_MANIFESTS, {});
}

// ------------------------------------------------------------------
// Tombstones
// ------------------------------------------------------------------

bool EntryWriter::IsDeprecated(const std::string& name) {
  return Exists(sql::SELECT_IS_DEPRECATED, {name});
}

void EntryWriter::InsertDeprecated(const std::string& name) {
  Run(sql::INSERT_DEPRECATED, {name});
}

// ------------------------------------------------------------------
// Packages and channels
// ------------------------------------------------------------------

bool EntryWriter::PackageExists(const std::string& name) {
  return Exists(sql::SELECT_PACKAGE_EXISTS, {name});
}

void EntryWriter::InsertPackage(const std::string& name) {
  Run(sql::INSERT_PACKAGE, {name});
}

void EntryWriter::SetDefaultChannel(const std::string& package, const std::string& channel) {
  Run(sql::UPDATE_DEFAULT_CHANNEL, {channel, package});
}

void EntryWriter::InsertChannel(const std::string& name, const std::string& package, const std::string& head) {
  Run(sql::INSERT_CHANNEL, {name, package, head});
}

void EntryWriter::RemovePackageChannels(const std::string& package) {
  Run(sql::DELETE_PACKAGE, {package});
  Run(sql::DELETE_PACKAGE_CHANNELS, {package});
  Run(sql::DELETE_PACKAGE_ENTRIES, {package});
}

std::vector<std::string> EntryWriter::PackageBundleNames(const std::string& package) {
  return Strings(sql::SELECT_PACKAGE_BUNDLE_NAMES, {package});
}

std::optional<ChannelRef> EntryWriter::DefaultChannelHeadedBy(const std::string& bundle_name) {
  auto& stmt = Prepared(sql::SELECT_DEFAULT_CHANNEL_HEADED_BY);
  stmt.Bind({bundle_name});
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ChannelRef{stmt.Text(0), stmt.Text(1)};
}

void EntryWriter::RemoveChannelsHeadedBy(const std::string& bundle_name) {
  Run(sql::DELETE_CHANNELS_HEADED_BY, {bundle_name});
}

// ------------------------------------------------------------------
// Channel entries
// ------------------------------------------------------------------

int64_t EntryWriter::InsertChannelEntry(const std::string& channel, const std::string& package, const std::string& bundle_name, int64_t depth) {
  Run(sql::INSERT_CHANNEL_ENTRY, {channel, package, bundle_name, depth});
  return tx_.DB().LastInsertRowId();
}

void EntryWriter::LinkReplaces(int64_t entry_id, int64_t replaces_entry_id) {
  Run(sql::UPDATE_ENTRY_REPLACES, {replaces_entry_id, entry_id});
}

std::vector<ChannelRef> EntryWriter::Membership(const std::string& bundle_name) {
  auto& stmt = Prepared(sql::SELECT_BUNDLE_MEMBERSHIP);
  stmt.Bind({bundle_name});
  std::vector<ChannelRef> out;
  while (stmt.Step()) {
    out.emplace_back(stmt.Text(0), stmt.Text(1));
  }
  return out;
}

std::vector<std::string> EntryWriter::Replacers(const std::string& bundle_name) {
  return Strings(sql::SELECT_BUNDLE_REPLACERS, {bundle_name});
}

void EntryWriter::RemoveEntriesInChannel(const std::string& bundle_name, const ChannelRef& channel) {
  Run(sql::NULL_REPLACES_INTO_BUNDLE_IN_CHANNEL, {bundle_name, channel.first, channel.second});
  Run(sql::DELETE_BUNDLE_ENTRIES_IN_CHANNEL, {bundle_name, channel.first, channel.second});
}

void EntryWriter::DetachReplaces(const std::string& bundle_name) {
  Run(sql::NULL_REPLACES_OF_BUNDLE, {bundle_name});
}

} // namespace catalog::registry
