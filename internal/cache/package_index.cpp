#include "internal/cache/package_index.hpp"

#include <algorithm>

namespace catalog::cache {

PackageIndex::PackageIndex(const v1::PackageIndex& index) {
  for (const auto& package : index.packages()) {
    auto& view           = packages_[package.name()];
    view.name            = package.name();
    view.default_channel = package.default_channel();
    for (const auto& channel : package.channels()) {
      auto& channel_view = view.channels[channel.name()];
      channel_view.name  = channel.name();
      channel_view.head  = channel.head();
      for (const auto& bundle : channel.bundles()) {
        channel_view.bundles.emplace(bundle.name(), bundle);
      }
    }
  }
}

const IndexedPackage* PackageIndex::FindPackage(const std::string& name) const {
  auto it = packages_.find(name);
  return it == packages_.end() ? nullptr : &it->second;
}

const IndexedChannel* PackageIndex::FindChannel(const std::string& package, const std::string& channel) const {
  const auto* found = FindPackage(package);
  if (!found) return nullptr;
  auto it = found->channels.find(channel);
  return it == found->channels.end() ? nullptr : &it->second;
}

bool BundleReplaces(const v1::IndexedBundle& b, const std::string& name) {
  return b.replaces() == name || std::find(b.skips().begin(), b.skips().end(), name) != b.skips().end();
}

} // namespace catalog::cache
