#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "catalog/cache/v1/index.pb.h"
#include "catalog/registry/v1/registry.pb.h"

namespace catalog::declcfg {

/*
  A package converted from its declarative metas.

  bundles holds one API bundle per channel entry, with replaces and
  skips of that channel.
*/
struct PackageModel {
  cache::v1::IndexedPackage         index;
  std::vector<registry::v1::Bundle> bundles;
};

/*
  Builds the model of one package from the JSON blobs of its metas.

  Validates that the package meta is unique, the default channel exists,
  every channel entry names a bundle of the package and every channel
  has exactly one head. Structural problems throw util::GraphError.
*/
PackageModel ConvertPackage(const std::string& package, const std::vector<std::string_view>& blobs);

} // namespace catalog::declcfg
