#pragma once

#include <string>
#include <vector>

#include "internal/registry/batch.hpp"

namespace catalog::registry {

class SqlLoader;
class SqlQuerier;

/*
  Deprecates a list of bundle images.

  A listed bundle that heads its package's default channel is only
  accepted when the heads of all the package's channels are listed too;
  the package is then removed outright. The other paths are deprecated
  one at a time. Paths that no longer resolve, because an earlier
  deprecation truncated them, are skipped.
*/
class PackageDeprecator {
 public:
  PackageDeprecator(SqlLoader& loader, const SqlQuerier& querier, BatchMode mode = BatchMode::kPermissive);

  void Deprecate(const std::vector<std::string>& bundle_paths);

 private:
  // Returns the paths left to deprecate.
  std::vector<std::string> MaybeRemovePackages(const std::vector<std::string>& bundle_paths, BatchErrors& errors);

  SqlLoader&        loader_;
  const SqlQuerier& querier_;
  BatchMode         mode_;
};

} // namespace catalog::registry
