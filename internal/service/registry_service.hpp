#pragma once

#include <vector>

#include "internal/registry/query.hpp"
#include "service_context.hpp"
#include "catalog/registry/v1.hpp"

namespace catalog::service {

/*
  Request handling for the Registry API.

  Translates wire requests into query calls, traces and times each
  one. Errors propagate as the util exception types.
*/
class RegistryService {
public:
  explicit RegistryService(ServiceContext ctx);

  std::vector<std::string> ListPackages();

  catalog::registry::v1::Package
  GetPackage(const catalog::registry::v1::GetPackageRequest& req);

  catalog::registry::v1::Bundle
  GetBundle(const catalog::registry::v1::GetBundleRequest& req);

  catalog::registry::v1::Bundle
  GetBundleForChannel(const catalog::registry::v1::GetBundleInChannelRequest& req);

  std::vector<catalog::registry::v1::ChannelEntry>
  GetChannelEntriesThatReplace(const catalog::registry::v1::GetAllReplacementsRequest& req);

  catalog::registry::v1::Bundle
  GetBundleThatReplaces(const catalog::registry::v1::GetReplacementRequest& req);

  std::vector<catalog::registry::v1::ChannelEntry>
  GetChannelEntriesThatProvide(const catalog::registry::v1::GetAllProvidersRequest& req);

  std::vector<catalog::registry::v1::ChannelEntry>
  GetLatestChannelEntriesThatProvide(const catalog::registry::v1::GetLatestProvidersRequest& req);

  catalog::registry::v1::Bundle
  GetDefaultBundleThatProvides(const catalog::registry::v1::GetDefaultProviderRequest& req);

  // Streams every bundle through send until it returns false.
  void ListBundles(const catalog::registry::BundleSender& send);

private:
  ServiceContext ctx_;
};

}
