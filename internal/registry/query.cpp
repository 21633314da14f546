#include "internal/registry/query.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace catalog::registry {

std::string Describe(const model::GroupVersionKind& gvk) {
  return gvk.group + " " + gvk.version + " " + gvk.kind;
}

v1::ChannelEntry MakeChannelEntry(const std::string& pkg, const std::string& channel, const std::string& bundle, const std::string& replaces) {
  v1::ChannelEntry entry;
  entry.set_package_name(pkg);
  entry.set_channel_name(channel);
  entry.set_bundle_name(bundle);
  entry.set_replaces(replaces);
  return entry;
}

v1::Bundle Query::GetBundleThatProvides(const model::GroupVersionKind& gvk) const {
  auto latest = GetLatestChannelEntriesThatProvide(gvk);
  std::stable_sort(latest.begin(), latest.end(),
                   [](const v1::ChannelEntry& a, const v1::ChannelEntry& b) { return a.package_name() < b.package_name(); });

  std::string package;
  std::string default_channel;
  for (const auto& entry : latest) {
    if (entry.package_name() != package) {
      package         = entry.package_name();
      default_channel = GetPackage(package).default_channel_name();
    }
    if (entry.channel_name() == default_channel) {
      return GetBundle(entry.package_name(), entry.channel_name(), entry.bundle_name());
    }
  }
  throw util::NotFound("no entry found that provides " + Describe(gvk));
}

std::vector<v1::Bundle> Query::ListBundles() const {
  std::vector<v1::Bundle> out;
  SendBundles([&out](const v1::Bundle& bundle) {
    out.push_back(bundle);
    return true;
  });
  return out;
}

} // namespace catalog::registry
