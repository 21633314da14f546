#pragma once

#include <map>
#include <string>
#include <vector>

#include "catalog/cache/v1/index.pb.h"

namespace catalog::cache {

struct IndexedChannel {
  std::string                              name;
  std::string                              head;
  std::map<std::string, v1::IndexedBundle> bundles;

  bool Contains(const std::string& bundle) const {
    return bundles.contains(bundle);
  }
};

struct IndexedPackage {
  std::string                           name;
  std::string                           default_channel;
  std::map<std::string, IndexedChannel> channels;
};

/*
  In-memory view of the persisted package index, keyed for lookups.
*/
class PackageIndex {
 public:
  PackageIndex() = default;
  explicit PackageIndex(const v1::PackageIndex& index);

  const IndexedPackage* FindPackage(const std::string& name) const;
  const IndexedChannel* FindChannel(const std::string& package, const std::string& channel) const;

  const std::map<std::string, IndexedPackage>& Packages() const {
    return packages_;
  }

 private:
  std::map<std::string, IndexedPackage> packages_;
};

// True when b replaces or skips name.
bool BundleReplaces(const v1::IndexedBundle& b, const std::string& name);

} // namespace catalog::cache
