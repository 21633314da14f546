#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/model/bundle.hpp"
#include "internal/model/package.hpp"
#include "internal/registry/batch.hpp"

namespace catalog::registry {

class SqlLoader;
class SqlQuerier;

struct BundleSubmission {
  model::PackageManifest manifest;
  model::Bundle          bundle;
};

/*
  Adds many bundles. All bundles go in first, each in its own transaction,
  then the channels of every touched package are rebuilt from the last
  manifest submitted for it.
*/
class Populator {
 public:
  Populator(SqlLoader& loader, BatchMode mode = BatchMode::kPermissive);

  void Populate(const std::vector<BundleSubmission>& submissions);

 private:
  SqlLoader& loader_;
  BatchMode  mode_;
};

// Removes every package not named in the keep list.
class Pruner {
 public:
  Pruner(SqlLoader& loader, const SqlQuerier& querier, BatchMode mode = BatchMode::kPermissive);

  void Prune(const std::set<std::string>& keep);

 private:
  SqlLoader&        loader_;
  const SqlQuerier& querier_;
  BatchMode         mode_;
};

} // namespace catalog::registry
