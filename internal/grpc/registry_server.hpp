#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "catalog/registry/v1/registry.grpc.pb.h"
#include "internal/service/registry_service.hpp"
#include "catalog/registry/v1.hpp"

namespace catalog::grpc {

class RegistryServer final : public catalog::registry::v1::Registry::Service {
public:
  explicit RegistryServer(std::shared_ptr<catalog::service::RegistryService> svc);

  ::grpc::Status ListPackages(::grpc::ServerContext*,
                              const catalog::registry::v1::ListPackageRequest*,
                              ::grpc::ServerWriter<catalog::registry::v1::PackageName>*) override;

  ::grpc::Status GetPackage(::grpc::ServerContext*,
                            const catalog::registry::v1::GetPackageRequest*,
                            catalog::registry::v1::Package*) override;

  ::grpc::Status GetBundle(::grpc::ServerContext*,
                           const catalog::registry::v1::GetBundleRequest*,
                           catalog::registry::v1::Bundle*) override;

  ::grpc::Status GetBundleForChannel(::grpc::ServerContext*,
                                     const catalog::registry::v1::GetBundleInChannelRequest*,
                                     catalog::registry::v1::Bundle*) override;

  ::grpc::Status GetChannelEntriesThatReplace(::grpc::ServerContext*,
                                              const catalog::registry::v1::GetAllReplacementsRequest*,
                                              ::grpc::ServerWriter<catalog::registry::v1::ChannelEntry>*) override;

  ::grpc::Status GetBundleThatReplaces(::grpc::ServerContext*,
                                       const catalog::registry::v1::GetReplacementRequest*,
                                       catalog::registry::v1::Bundle*) override;

  ::grpc::Status GetChannelEntriesThatProvide(::grpc::ServerContext*,
                                              const catalog::registry::v1::GetAllProvidersRequest*,
                                              ::grpc::ServerWriter<catalog::registry::v1::ChannelEntry>*) override;

  ::grpc::Status GetLatestChannelEntriesThatProvide(::grpc::ServerContext*,
                                                    const catalog::registry::v1::GetLatestProvidersRequest*,
                                                    ::grpc::ServerWriter<catalog::registry::v1::ChannelEntry>*) override;

  ::grpc::Status GetDefaultBundleThatProvides(::grpc::ServerContext*,
                                              const catalog::registry::v1::GetDefaultProviderRequest*,
                                              catalog::registry::v1::Bundle*) override;

  ::grpc::Status ListBundles(::grpc::ServerContext*,
                             const catalog::registry::v1::ListBundlesRequest*,
                             ::grpc::ServerWriter<catalog::registry::v1::Bundle>*) override;

private:
  std::shared_ptr<catalog::service::RegistryService> service_;
};

}
