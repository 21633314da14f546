#include "internal/registry/populator.hpp"

#include <map>

#include "internal/observability/logging.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"

namespace catalog::registry {

using observability::IntField;
using observability::StringField;

Populator::Populator(SqlLoader& loader, BatchMode mode) : loader_(loader), mode_(mode) {
}

void Populator::Populate(const std::vector<BundleSubmission>& submissions) {
  BatchErrors                                   errors("populate", mode_);
  std::map<std::string, model::PackageManifest> manifests;

  for (const auto& submission : submissions) {
    manifests[submission.manifest.package_name] = submission.manifest;
    try {
      loader_.AddBundle(submission.bundle);
    } catch (const std::exception& e) {
      errors.Record(submission.bundle.name, e);
    }
  }

  for (const auto& [package, manifest] : manifests) {
    try {
      loader_.AddPackageChannels(manifest);
    } catch (const std::exception& e) {
      errors.Record(package, e);
    }
  }

  CATALOG_LOG_INFO("populated registry", {IntField("bundles", static_cast<int64_t>(submissions.size())),
                                          IntField("packages", static_cast<int64_t>(manifests.size()))});
  errors.ThrowIfAny();
}

Pruner::Pruner(SqlLoader& loader, const SqlQuerier& querier, BatchMode mode) : loader_(loader), querier_(querier), mode_(mode) {
}

void Pruner::Prune(const std::set<std::string>& keep) {
  BatchErrors errors("prune", mode_);
  for (const auto& package : querier_.ListPackages()) {
    if (keep.contains(package)) {
      continue;
    }
    try {
      loader_.RemovePackage(package);
      CATALOG_LOG_INFO("pruned package", {StringField("package", package)});
    } catch (const std::exception& e) {
      errors.Record(package, e);
    }
  }
  errors.ThrowIfAny();
}

} // namespace catalog::registry
