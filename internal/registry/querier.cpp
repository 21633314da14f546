#include "internal/registry/querier.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/model/properties.hpp"
#include "internal/registry/entry_writer.hpp"
#include "internal/util/errors.hpp"

namespace catalog::registry {

using db::sqlite::SqliteStatement;
namespace sql = db::sql;

namespace {

std::vector<std::string> Column(SqliteStatement& stmt) {
  std::vector<std::string> out;
  while (stmt.Step()) {
    out.push_back(stmt.Text(0));
  }
  return out;
}

void ToApi(const model::GroupVersionKind& gvk, v1::GroupVersionKind* out) {
  out->set_group(gvk.group);
  out->set_version(gvk.version);
  out->set_kind(gvk.kind);
  out->set_plural(gvk.plural);
}

void ClearGraphFields(v1::Bundle& bundle) {
  bundle.clear_replaces();
  bundle.clear_skips();
}

} // namespace

SqlQuerier::SqlQuerier(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

bool SqlQuerier::PackageExists(const std::string& pkg) const {
  SqliteStatement stmt(*db_, sql::SELECT_PACKAGE_EXISTS, {pkg});
  return stmt.Step();
}

std::vector<model::GroupVersionKind> SqlQuerier::Apis(const char* query, const std::string& csv_name) const {
  SqliteStatement                      stmt(*db_, query, {csv_name});
  std::vector<model::GroupVersionKind> out;
  while (stmt.Step()) {
    out.push_back(model::GroupVersionKind{stmt.Text(0), stmt.Text(1), stmt.Text(2), stmt.Text(3)});
  }
  return out;
}

/*
  Assembles an API bundle from (name, csv, bundle, bundlepath, version,
  skiprange) starting at first_column, plus its facts and APIs.
*/
v1::Bundle SqlQuerier::ReadBundle(const SqliteStatement& stmt, int first_column, const std::string& pkg, const std::string& channel) const {
  v1::Bundle bundle;
  const auto name     = stmt.Text(first_column);
  const auto csv      = stmt.OptionalText(first_column + 1);
  const auto manifest = stmt.OptionalText(first_column + 2);

  if (manifest && !manifest->empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(*manifest, &bundle, options);
    if (!status.ok()) {
      throw std::runtime_error("decode stored manifest of " + name + ": " + std::string(status.message()));
    }
  } else if (csv) {
    bundle.set_csv_json(*csv);
  }

  bundle.set_csv_name(name);
  bundle.set_package_name(pkg);
  bundle.set_channel_name(channel);
  bundle.set_bundle_path(stmt.Text(first_column + 3));
  bundle.set_version(stmt.Text(first_column + 4));
  bundle.set_skip_range(stmt.Text(first_column + 5));

  for (const auto& gvk : Apis(sql::SELECT_PROVIDED_APIS, name)) {
    ToApi(gvk, bundle.add_provided_apis());
  }
  for (const auto& gvk : Apis(sql::SELECT_REQUIRED_APIS, name)) {
    ToApi(gvk, bundle.add_required_apis());
  }
  for (const auto& property : GetPropertiesForBundle(name)) {
    auto* out = bundle.add_properties();
    out->set_type(property.type);
    out->set_value(property.value);
  }
  for (const auto& dependency : GetDependenciesForBundle(name)) {
    auto* out = bundle.add_dependencies();
    out->set_type(dependency.type);
    out->set_value(dependency.value);
  }
  return bundle;
}

// ------------------------------------------------------------------
// Query
// ------------------------------------------------------------------

std::vector<std::string> SqlQuerier::ListPackages() const {
  SqliteStatement stmt(*db_, sql::SELECT_PACKAGE_NAMES);
  return Column(stmt);
}

v1::Package SqlQuerier::GetPackage(const std::string& name) const {
  if (!PackageExists(name)) {
    throw util::NotFound("package " + name + " not found");
  }

  v1::Package package;
  package.set_name(name);
  package.set_default_channel_name(GetDefaultChannelForPackage(name));

  SqliteStatement stmt(*db_, sql::SELECT_PACKAGE_CHANNEL_HEADS, {name});
  while (stmt.Step()) {
    auto* channel = package.add_channels();
    channel->set_name(stmt.Text(0));
    channel->set_csv_name(stmt.Text(1));
  }
  return package;
}

v1::Bundle SqlQuerier::GetBundle(const std::string& pkg, const std::string& channel, const std::string& csv_name) const {
  SqliteStatement stmt(*db_, sql::SELECT_BUNDLE_IN_CHANNEL, {csv_name, pkg, channel});
  if (!stmt.Step()) {
    throw util::NotFound("no entry found for " + pkg + " " + channel + " " + csv_name);
  }
  auto bundle = ReadBundle(stmt, 0, pkg, channel);
  ClearGraphFields(bundle);
  return bundle;
}

v1::Bundle SqlQuerier::GetBundleForChannel(const std::string& pkg, const std::string& channel) const {
  SqliteStatement stmt(*db_, sql::SELECT_CHANNEL_HEAD_BUNDLE, {pkg, channel});
  if (!stmt.Step()) {
    throw util::NotFound("no entry found for " + pkg + " " + channel);
  }
  auto bundle = ReadBundle(stmt, 0, pkg, channel);
  ClearGraphFields(bundle);
  return bundle;
}

v1::Bundle SqlQuerier::GetBundleThatReplaces(const std::string& name, const std::string& pkg, const std::string& channel) const {
  SqliteStatement stmt(*db_, sql::SELECT_BUNDLE_THAT_REPLACES, {name, pkg, channel});
  if (!stmt.Step()) {
    throw util::NotFound("no entry found for " + pkg + " " + channel);
  }
  auto bundle = ReadBundle(stmt, 0, pkg, channel);
  ClearGraphFields(bundle);
  return bundle;
}

std::vector<v1::ChannelEntry> SqlQuerier::GetChannelEntriesThatReplace(const std::string& name) const {
  SqliteStatement               stmt(*db_, sql::SELECT_ENTRIES_THAT_REPLACE, {name});
  std::vector<v1::ChannelEntry> out;
  while (stmt.Step()) {
    out.push_back(MakeChannelEntry(stmt.Text(0), stmt.Text(1), stmt.Text(2), name));
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that replace " + name);
  }
  return out;
}

std::vector<v1::ChannelEntry> SqlQuerier::GetChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const {
  SqliteStatement               stmt(*db_, sql::SELECT_ENTRIES_THAT_PROVIDE, {gvk.group, gvk.version, gvk.kind});
  std::vector<v1::ChannelEntry> out;
  while (stmt.Step()) {
    out.push_back(MakeChannelEntry(stmt.Text(0), stmt.Text(1), stmt.Text(2), stmt.OptionalText(3).value_or("")));
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that provide " + Describe(gvk));
  }
  return out;
}

/*
  One entry per providing head with its real replaces, plus one per skip
  edge of the head whose target is a stored bundle.
*/
std::vector<v1::ChannelEntry> SqlQuerier::GetLatestChannelEntriesThatProvide(const model::GroupVersionKind& gvk) const {
  SqliteStatement               heads(*db_, sql::SELECT_PROVIDING_CHANNEL_HEADS, {gvk.group, gvk.version, gvk.kind});
  std::vector<v1::ChannelEntry> out;

  while (heads.Step()) {
    const auto pkg     = heads.Text(0);
    const auto channel = heads.Text(1);
    const auto head    = heads.Text(2);

    SqliteStatement       edges(*db_, sql::SELECT_HEAD_ENTRY_EDGES, {pkg, channel, head});
    std::string           replaces;
    std::set<std::string> skips;
    while (edges.Step()) {
      const auto target = edges.OptionalText(1);
      if (edges.Int64(0) == 0) {
        replaces = target.value_or("");
      } else if (target && edges.Int64(2) != 0) {
        skips.insert(*target);
      }
    }

    out.push_back(MakeChannelEntry(pkg, channel, head, replaces));
    for (const auto& skip : skips) {
      if (skip != replaces) {
        out.push_back(MakeChannelEntry(pkg, channel, head, skip));
      }
    }
  }
  if (out.empty()) {
    throw util::NotFound("no channel entries found that provide " + Describe(gvk));
  }
  return out;
}

void SqlQuerier::SendBundles(const BundleSender& send) const {
  SqliteStatement stmt(*db_, sql::SELECT_LISTED_BUNDLES);
  while (stmt.Step()) {
    auto bundle = ReadBundle(stmt, 2, stmt.Text(0), stmt.Text(1));
    bundle.set_replaces(stmt.Text(8));
    for (const auto& skip : SplitSkips(stmt.Text(9))) {
      bundle.add_skips(skip);
    }
    if (!bundle.bundle_path().empty()) {
      bundle.clear_csv_json();
      bundle.clear_object();
    }
    if (!send(bundle)) {
      return;
    }
  }
}

// ------------------------------------------------------------------
// Maintenance reads
// ------------------------------------------------------------------

std::vector<ChannelHead> SqlQuerier::ListChannels() const {
  SqliteStatement          stmt(*db_, sql::SELECT_ALL_CHANNELS);
  std::vector<ChannelHead> out;
  while (stmt.Step()) {
    out.push_back(ChannelHead{stmt.Text(0), stmt.Text(1), stmt.Text(2)});
  }
  return out;
}

std::string SqlQuerier::GetDefaultChannelForPackage(const std::string& pkg) const {
  SqliteStatement stmt(*db_, sql::SELECT_DEFAULT_CHANNEL, {pkg});
  if (!stmt.Step()) {
    throw util::NotFound("package " + pkg + " not found");
  }
  return stmt.Text(0);
}

std::string SqlQuerier::GetCurrentCSVNameForChannel(const std::string& pkg, const std::string& channel) const {
  SqliteStatement stmt(*db_, sql::SELECT_CHANNEL_HEAD_NAME, {pkg, channel});
  if (!stmt.Step()) {
    throw util::NotFound("no entry found for " + pkg + " " + channel);
  }
  return stmt.Text(0);
}

std::vector<std::string> SqlQuerier::GetBundlePathsForPackage(const std::string& pkg) const {
  SqliteStatement stmt(*db_, sql::SELECT_PACKAGE_BUNDLE_PATHS, {pkg});
  return Column(stmt);
}

std::vector<std::string> SqlQuerier::ListImages() const {
  SqliteStatement stmt(*db_, sql::SELECT_ALL_IMAGES);
  return Column(stmt);
}

std::vector<std::string> SqlQuerier::GetImagesForBundle(const std::string& csv_name) const {
  SqliteStatement stmt(*db_, sql::SELECT_BUNDLE_IMAGES, {csv_name, csv_name});
  return Column(stmt);
}

std::pair<std::vector<model::GroupVersionKind>, std::vector<model::GroupVersionKind>> SqlQuerier::GetApisForEntry(int64_t entry_id) const {
  SqliteStatement stmt(*db_, sql::SELECT_ENTRY_BUNDLE, {entry_id});
  if (!stmt.Step()) {
    throw util::NotFound("no channel entry " + std::to_string(entry_id));
  }
  const auto name = stmt.Text(0);
  return {Apis(sql::SELECT_PROVIDED_APIS, name), Apis(sql::SELECT_REQUIRED_APIS, name)};
}

std::vector<model::Dependency> SqlQuerier::GetDependenciesForBundle(const std::string& csv_name) const {
  SqliteStatement                stmt(*db_, sql::SELECT_BUNDLE_DEPENDENCIES, {csv_name});
  std::vector<model::Dependency> out;
  while (stmt.Step()) {
    out.push_back(model::Dependency{stmt.Text(0), stmt.Text(1)});
  }
  return out;
}

std::vector<model::Property> SqlQuerier::GetPropertiesForBundle(const std::string& csv_name) const {
  SqliteStatement              stmt(*db_, sql::SELECT_BUNDLE_PROPERTIES, {csv_name});
  std::vector<model::Property> out;
  while (stmt.Step()) {
    out.push_back(model::Property{stmt.Text(0), stmt.Text(1)});
  }
  return out;
}

std::vector<model::AnnotatedChannelEntry> SqlQuerier::GetChannelEntriesFromPackage(const std::string& pkg) const {
  SqliteStatement                           stmt(*db_, sql::SELECT_PACKAGE_ENTRIES_ANNOTATED, {pkg});
  std::vector<model::AnnotatedChannelEntry> out;
  while (stmt.Step()) {
    model::AnnotatedChannelEntry entry;
    entry.package_name         = stmt.Text(0);
    entry.channel_name         = stmt.Text(1);
    entry.bundle_name          = stmt.Text(2);
    entry.bundle_path          = stmt.Text(3);
    entry.version              = stmt.Text(4);
    entry.replaces             = stmt.Text(5);
    entry.replaces_version     = stmt.Text(6);
    entry.replaces_bundle_path = stmt.Text(7);
    out.push_back(std::move(entry));
  }
  return out;
}

std::set<model::BundleKey> SqlQuerier::GetBundlesForPackage(const std::string& pkg) const {
  SqliteStatement            stmt(*db_, sql::SELECT_PACKAGE_BUNDLE_KEYS, {pkg});
  std::set<model::BundleKey> out;
  while (stmt.Step()) {
    out.insert(model::BundleKey{stmt.Text(0), stmt.Text(1), stmt.Text(2)});
  }
  return out;
}

std::optional<std::pair<std::string, std::string>> SqlQuerier::GetBundleNameAndVersionForImage(const std::string& path) const {
  SqliteStatement stmt(*db_, sql::SELECT_BUNDLE_BY_PATH, {path});
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return std::make_pair(stmt.Text(0), stmt.Text(1));
}

} // namespace catalog::registry
