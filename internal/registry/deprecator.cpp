#include "internal/registry/deprecator.hpp"

#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"
#include "internal/util/errors.hpp"

namespace catalog::registry {

using observability::IntField;
using observability::StringField;

PackageDeprecator::PackageDeprecator(SqlLoader& loader, const SqlQuerier& querier, BatchMode mode)
    : loader_(loader), querier_(querier), mode_(mode) {
}

void PackageDeprecator::Deprecate(const std::vector<std::string>& bundle_paths) {
  CATALOG_LOG_INFO("deprecating bundles", {IntField("count", static_cast<int64_t>(bundle_paths.size()))});

  BatchErrors errors("deprecate", mode_);
  for (const auto& path : MaybeRemovePackages(bundle_paths, errors)) {
    try {
      loader_.DeprecateBundle(path);
    } catch (const util::BundleImageNotFound&) {
      CATALOG_LOG_DEBUG("bundle already removed", {StringField("path", path)});
    } catch (const std::exception& e) {
      errors.Record(path, e);
    }
  }
  errors.ThrowIfAny();
}

std::vector<std::string> PackageDeprecator::MaybeRemovePackages(const std::vector<std::string>& bundle_paths, BatchErrors& errors) {
  std::set<std::string> listed;
  for (const auto& path : bundle_paths) {
    if (auto found = querier_.GetBundleNameAndVersionForImage(path)) {
      listed.insert(found->first);
    }
  }

  std::map<std::string, std::vector<ChannelHead>> heads_by_package;
  for (auto& head : querier_.ListChannels()) {
    heads_by_package[head.package_name].push_back(std::move(head));
  }

  std::vector<std::string> packages;
  for (const auto& [package, heads] : heads_by_package) {
    const auto default_channel = querier_.GetDefaultChannelForPackage(package);
    bool       default_listed  = false;
    for (const auto& head : heads) {
      if (head.channel_name == default_channel && listed.contains(head.head)) default_listed = true;
    }
    if (!default_listed) {
      continue;
    }

    for (const auto& head : heads) {
      if (listed.contains(head.head)) continue;
      std::string path = head.head;
      for (const auto& key : querier_.GetBundlesForPackage(package)) {
        if (key.csv_name == head.head && !key.bundle_path.empty()) path = key.bundle_path;
      }
      throw util::DefaultChannelHeadRemoval("cannot deprecate default channel head from package without removing all other channel heads in package " +
                                            package + ": must deprecate " + path + ", head of channel " + head.channel_name);
    }
    packages.push_back(package);
  }

  std::set<std::string> removed_paths;
  for (const auto& package : packages) {
    for (const auto& key : querier_.GetBundlesForPackage(package)) {
      removed_paths.insert(key.bundle_path);
    }
    CATALOG_LOG_INFO("removing fully deprecated package", {StringField("package", package)});
    try {
      loader_.RemovePackage(package);
    } catch (const std::exception& e) {
      errors.Record(package, e);
    }
  }

  std::vector<std::string> remaining;
  for (const auto& path : bundle_paths) {
    if (!removed_paths.contains(path)) remaining.push_back(path);
  }
  return remaining;
}

} // namespace catalog::registry
