#include "internal/registry/loader.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <deque>
#include <set>
#include <vector>

#include "catalog/registry/v1/registry.pb.h"
#include "internal/db/sqlite/sqlite_migrator.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/model/properties.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/entry_writer.hpp"
#include "internal/util/errors.hpp"

namespace catalog::registry {

using db::sqlite::SqliteTransaction;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kSubstitutesForAlphaOnly =
    "SubstitutesFor is an alpha-only feature. You must enable alpha features in order to use this feature.";

// Manifest content stored in operatorbundle.bundle.
std::string EncodeManifest(const model::Bundle& bundle) {
  if (bundle.csv_json.empty() && bundle.objects.empty()) {
    return {};
  }
  v1::Bundle manifest;
  manifest.set_csv_json(bundle.csv_json);
  for (const auto& object : bundle.objects) {
    manifest.add_object(object);
  }
  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(manifest, &out);
  if (!status.ok()) {
    throw std::runtime_error("encode manifest of " + bundle.name + ": " + std::string(status.message()));
  }
  return out;
}

std::string ChannelError(const std::string& package, const std::string& channel, const std::string& message) {
  return "channel " + channel + " of package " + package + ": " + message;
}

} // namespace

SqlLoader::SqlLoader(std::shared_ptr<db::sqlite::SqliteDB> db, LoaderOptions options) : db_(std::move(db)), options_(options) {
  db::sqlite::Migrate(db_);
}

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

void SqlLoader::AddBundle(const model::Bundle& bundle) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  AddBundle(writer, bundle);
  tx.Commit();
}

void SqlLoader::AddBundle(EntryWriter& writer, const model::Bundle& bundle) {
  if (bundle.name.empty()) {
    throw util::InvalidState("bundle name not found");
  }
  if (!bundle.substitutes_for.empty() && !options_.enable_alpha) {
    throw util::UnsupportedFeature(kSubstitutesForAlphaOnly);
  }
  if (writer.FindBundle(bundle.name)) {
    throw util::AlreadyExists("bundle " + bundle.name + " already exists");
  }

  writer.InsertBundle(bundle, EncodeManifest(bundle));

  const BundleRow owner{bundle.name, bundle.version, bundle.bundle_path, bundle.replaces, bundle.skips, bundle.substitutes_for};

  std::set<std::string> images(bundle.related_images.begin(), bundle.related_images.end());
  for (const auto& image : images) {
    if (!image.empty()) writer.InsertRelatedImage(image, bundle.name);
  }

  std::set<model::GroupVersionKind> required(bundle.required_apis.begin(), bundle.required_apis.end());
  for (const auto& dependency : bundle.dependencies) {
    if (dependency.type == model::kGvkType) {
      required.insert(model::ParseGvkValue(dependency.value));
      continue;
    }
    writer.InsertDependency(owner, dependency.type, dependency.value);
  }
  for (const auto& gvk : required) {
    writer.InsertDependency(owner, std::string(model::kGvkType), model::GvkValue(gvk));
    writer.InsertRequiredApi(owner, gvk);
  }

  std::set<model::GroupVersionKind> provided(bundle.provided_apis.begin(), bundle.provided_apis.end());
  for (const auto& property : bundle.properties) {
    if (property.type == model::kGvkType) {
      provided.insert(model::ParseGvkValue(property.value));
      continue;
    }
    writer.InsertProperty(owner, property.type, property.value);
  }
  for (const auto& gvk : provided) {
    writer.InsertProperty(owner, std::string(model::kGvkType), model::GvkValue(gvk));
    writer.InsertProvidedApi(owner, gvk);
  }

  if (writer.IsDeprecated(bundle.name)) {
    writer.InsertProperty(owner, std::string(model::kDeprecatedType), model::DeprecatedValue());
  }

  if (options_.enable_alpha && !bundle.substitutes_for.empty()) {
    AddSubstitutesFor(writer, bundle);
  }
}

/*
  The substitute takes over every replaces edge pointing at the bundle it
  substitutes for, and skips the whole substitution chain.
*/
void SqlLoader::AddSubstitutesFor(EntryWriter& writer, const model::Bundle& bundle) {
  const auto& target = bundle.substitutes_for;

  for (const auto& other : writer.SubstitutionsFor(target)) {
    if (other != bundle.name) {
      throw util::InvalidState("cannot determine latest substitution for " + target + ": already substituted by " + other);
    }
  }

  writer.RedirectReplaces(target, bundle.name);

  std::vector<std::string> skips = bundle.skips;
  std::set<std::string>    chain{bundle.name};
  for (std::string current = target; !current.empty() && !chain.contains(current);) {
    chain.insert(current);
    if (std::find(skips.begin(), skips.end(), current) == skips.end()) {
      skips.push_back(current);
    }
    auto row = writer.FindBundle(current);
    current  = row ? row->substitutes_for : std::string();
  }
  writer.UpdateSkips(bundle.name, skips);
}

// ------------------------------------------------------------------
// Channels
// ------------------------------------------------------------------

void SqlLoader::AddPackageChannels(const model::PackageManifest& manifest) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  AddPackageChannels(writer, manifest);
  tx.Commit();
}

void SqlLoader::AddBundlePackageChannels(const model::PackageManifest& manifest, const model::Bundle& bundle) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  AddBundle(writer, bundle);
  AddPackageChannels(writer, manifest);
  tx.Commit();
}

void SqlLoader::AddPackageChannels(EntryWriter& writer, const model::PackageManifest& manifest) {
  const auto& package = manifest.package_name;
  if (package.empty()) {
    throw util::InvalidState("package manifest has no package name");
  }

  writer.RemovePackageChannels(package);
  writer.InsertPackage(package);

  std::vector<std::string>           errors;
  std::vector<model::PackageChannel> channels;
  bool                               has_default = false;

  for (const auto& channel : manifest.channels) {
    if (writer.IsDeprecated(channel.current_csv_name)) {
      CATALOG_LOG_INFO("eliding channel with deprecated head",
                       {StringField("package", package), StringField("channel", channel.name), StringField("head", channel.current_csv_name)});
      continue;
    }
    writer.InsertChannel(channel.name, package, channel.current_csv_name);
    if (channel.name == manifest.default_channel_name || manifest.channels.size() == 1) {
      writer.SetDefaultChannel(package, channel.name);
      has_default = true;
    }
    channels.push_back(channel);
  }
  if (!has_default) {
    errors.push_back("no default channel specified for " + package);
  }

  for (const auto& channel : channels) {
    auto walk = WalkChannel(writer, package, channel.name, channel.current_csv_name);
    if (walk.error) {
      errors.push_back(ChannelError(package, channel.name, *walk.error));
    }
  }

  util::ThrowIfAny(std::move(errors));
}

/*
  Inserts the head entry at depth 0 and follows replaces from there.

  Each real hop is one level deeper than the previous. Skips of the cursor
  become placeholder pairs (skipped, cursor) at depth+1, depth+2, ...
  without advancing the real chain. The walk ends at an empty replaces, at
  a tombstoned cursor, or at a tombstoned replaces target with no row.
*/
SqlLoader::WalkResult SqlLoader::WalkChannel(EntryWriter& writer, const std::string& package, const std::string& channel,
                                             const std::string& head) {
  WalkResult result;

  int64_t               cursor_id = writer.InsertChannelEntry(channel, package, head, 0);
  std::string           cursor    = head;
  int64_t               depth     = 0;
  std::set<std::string> seen{head};

  while (true) {
    auto row = writer.FindBundle(cursor);
    if (!row) {
      result.error = "no bundle found for " + cursor;
      return result;
    }

    writer.InsertProperty(*row, std::string(model::kPackageType), model::PackageValue(package, row->version));

    int64_t synthetic_depth = depth + 1;
    for (const auto& skip : row->skips) {
      const int64_t skipped_id     = writer.InsertChannelEntry(channel, package, skip, synthetic_depth);
      const int64_t synthesized_id = writer.InsertChannelEntry(channel, package, cursor, synthetic_depth);
      writer.LinkReplaces(synthesized_id, skipped_id);
      ++synthetic_depth;
    }

    if (row->replaces.empty() || writer.IsDeprecated(cursor)) {
      break;
    }
    if (seen.contains(row->replaces)) {
      result.error = "Cycle detected, " + cursor + " replaces " + row->replaces;
      return result;
    }
    seen.insert(row->replaces);

    const bool replaced_exists = writer.FindBundle(row->replaces).has_value();
    if (!replaced_exists && !writer.IsDeprecated(row->replaces)) {
      result.error = "Invalid bundle " + cursor + ", replaces nonexistent bundle " + row->replaces;
      return result;
    }

    ++depth;
    const int64_t replaced_id = writer.InsertChannelEntry(channel, package, row->replaces, depth);
    writer.LinkReplaces(cursor_id, replaced_id);
    if (!replaced_exists) {
      break;
    }

    cursor    = row->replaces;
    cursor_id = replaced_id;
  }

  result.terminal_depth = depth;
  return result;
}

void SqlLoader::AddPackageChannelsFromGraph(const model::Package& graph) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);

  if (graph.name.empty()) {
    throw util::InvalidState("package graph has no package name");
  }

  writer.RemovePackageChannels(graph.name);
  writer.InsertPackage(graph.name);

  std::vector<std::string> errors;
  bool                     has_default = false;

  for (const auto& [name, channel] : graph.channels) {
    const auto& head = channel.head.csv_name;
    if (writer.IsDeprecated(head)) {
      continue;
    }
    writer.InsertChannel(name, graph.name, head);
    if (name == graph.default_channel) {
      writer.SetDefaultChannel(graph.name, name);
      has_default = true;
    }

    auto walk = WalkChannel(writer, graph.name, name, head);
    if (walk.error) {
      errors.push_back(ChannelError(graph.name, name, *walk.error));
      continue;
    }

    int64_t real_members = 0;
    for (const auto& [node, replaced] : channel.nodes) {
      if (writer.FindBundle(node.csv_name)) ++real_members;
    }
    if (walk.terminal_depth + 1 != real_members) {
      errors.push_back(ChannelError(graph.name, name,
                                    "Invalid graph: walked " + std::to_string(walk.terminal_depth + 1) + " of " +
                                        std::to_string(real_members) + " bundles, some nodes are not reachable from the head"));
    }
  }
  if (!has_default) {
    errors.push_back("no default channel specified for " + graph.name);
  }

  util::ThrowIfAny(std::move(errors));
  tx.Commit();
}

// ------------------------------------------------------------------
// Removal
// ------------------------------------------------------------------

void SqlLoader::RemovePackage(const std::string& package_name) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  RemovePackage(writer, package_name);
  tx.Commit();
}

void SqlLoader::RemovePackage(EntryWriter& writer, const std::string& package_name) {
  if (!writer.PackageExists(package_name)) {
    throw util::NotFound("package " + package_name + " not found");
  }

  const auto bundles = writer.PackageBundleNames(package_name);
  for (const auto& name : bundles) {
    writer.RemoveBundle(name);
  }
  writer.RemovePackageChannels(package_name);
  RemoveStrandedBundles(writer);

  CATALOG_LOG_INFO("removed package", {StringField("package", package_name), IntField("bundles", static_cast<int64_t>(bundles.size()))});
}

void SqlLoader::RemoveStrandedBundles() {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  RemoveStrandedBundles(writer);
  tx.Commit();
}

void SqlLoader::RemoveStrandedBundles(EntryWriter& writer) {
  for (const auto& name : writer.StrandedBundles()) {
    writer.RemoveBundle(name);
  }
}

void SqlLoader::ClearNonHeadBundles() {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  writer.ClearNonHeadManifests();
  tx.Commit();
}

// ------------------------------------------------------------------
// Deprecation
// ------------------------------------------------------------------

void SqlLoader::DeprecateBundle(const std::string& bundle_path) {
  SqliteTransaction tx(*db_);
  EntryWriter       writer(tx);
  DeprecateBundle(writer, bundle_path);
  tx.Commit();
}

/*
  Tombstones the bundle behind bundle_path and truncates everything below it.

  A tail member loses its entries in the channels shared with the
  deprecated bundle. Its row goes only when it has no membership outside
  those channels and nothing outside the tail replaces it.
*/
void SqlLoader::DeprecateBundle(EntryWriter& writer, const std::string& bundle_path) {
  auto found = writer.FindBundleByPath(bundle_path);
  if (!found) {
    throw util::BundleImageNotFound(bundle_path);
  }
  const std::string name = found->first;

  if (writer.DefaultChannelHeadedBy(name)) {
    throw util::DefaultChannelHeadRemoval();
  }

  const auto                 membership = writer.Membership(name);
  const std::set<ChannelRef> head_channels(membership.begin(), membership.end());

  const auto named_row = writer.FindBundle(name);
  if (!named_row) {
    throw util::BundleImageNotFound(bundle_path);
  }

  // breadth-first over replaces and skips, in replacement order
  std::vector<std::string> tail;
  std::set<std::string>    visited{name};
  std::deque<std::string>  pending;
  auto                     enqueue = [&pending](const BundleRow& row) {
    if (!row.replaces.empty()) pending.push_back(row.replaces);
    for (const auto& skip : row.skips) pending.push_back(skip);
  };
  enqueue(*named_row);

  while (!pending.empty()) {
    const std::string next = pending.front();
    pending.pop_front();
    if (!visited.insert(next).second) {
      continue;
    }
    auto row = writer.FindBundle(next);
    if (!row) {
      continue;
    }
    if (writer.DefaultChannelHeadedBy(next)) {
      throw util::DefaultChannelHeadRemoval();
    }
    tail.push_back(next);
    enqueue(*row);
  }

  std::set<std::string> truncated(tail.begin(), tail.end());
  truncated.insert(name);

  int64_t removed = 0;
  for (const auto& member : tail) {
    const auto channels  = writer.Membership(member);
    const auto replacers = writer.Replacers(member);

    bool contained = true;
    for (const auto& channel : channels) {
      if (head_channels.contains(channel)) {
        writer.RemoveEntriesInChannel(member, channel);
      } else {
        contained = false;
      }
    }
    const bool replaced_inside =
        std::all_of(replacers.begin(), replacers.end(), [&truncated](const std::string& replacer) { return truncated.contains(replacer); });

    if (contained && replaced_inside) {
      writer.RemoveBundle(member);
      ++removed;
    }
  }

  writer.DetachReplaces(name);
  writer.RemoveChannelsHeadedBy(name);
  writer.InsertProperty(*named_row, std::string(model::kDeprecatedType), model::DeprecatedValue());
  writer.InsertDeprecated(name);

  CATALOG_LOG_INFO("deprecated bundle", {StringField("bundle", name), StringField("path", bundle_path), IntField("tail", static_cast<int64_t>(tail.size())),
                                         IntField("removed", removed)});
}

} // namespace catalog::registry
