#include "registry_server.hpp"
#include "grpc_error.hpp"

#include <vector>

namespace catalog::grpc {

using namespace catalog::registry::v1;

namespace {

// Stops early when the client goes away.
::grpc::Status WriteEntries(::grpc::ServerContext* ctx, const std::vector<ChannelEntry>& entries,
                            ::grpc::ServerWriter<ChannelEntry>* writer) {
  for (const auto& entry : entries) {
    if (ctx && ctx->IsCancelled()) {
      return {::grpc::StatusCode::CANCELLED, "client cancelled stream"};
    }
    if (!writer->Write(entry)) {
      break;
    }
  }
  return ::grpc::Status::OK;
}

} // namespace

RegistryServer::RegistryServer(std::shared_ptr<catalog::service::RegistryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RegistryServer::ListPackages(::grpc::ServerContext* ctx,
                                            const ListPackageRequest*,
                                            ::grpc::ServerWriter<PackageName>* writer) {
  try {
    for (const auto& name : service_->ListPackages()) {
      if (ctx && ctx->IsCancelled()) {
        return {::grpc::StatusCode::CANCELLED, "client cancelled stream"};
      }
      PackageName msg;
      msg.set_name(name);
      if (!writer->Write(msg)) {
        break;
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetPackage(::grpc::ServerContext*,
                                          const GetPackageRequest* req,
                                          Package* resp) {
  try {
    *resp = service_->GetPackage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetBundle(::grpc::ServerContext*,
                                         const GetBundleRequest* req,
                                         Bundle* resp) {
  try {
    *resp = service_->GetBundle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetBundleForChannel(::grpc::ServerContext*,
                                                   const GetBundleInChannelRequest* req,
                                                   Bundle* resp) {
  try {
    *resp = service_->GetBundleForChannel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetChannelEntriesThatReplace(::grpc::ServerContext* ctx,
                                                            const GetAllReplacementsRequest* req,
                                                            ::grpc::ServerWriter<ChannelEntry>* writer) {
  try {
    return WriteEntries(ctx, service_->GetChannelEntriesThatReplace(*req), writer);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetBundleThatReplaces(::grpc::ServerContext*,
                                                     const GetReplacementRequest* req,
                                                     Bundle* resp) {
  try {
    *resp = service_->GetBundleThatReplaces(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetChannelEntriesThatProvide(::grpc::ServerContext* ctx,
                                                            const GetAllProvidersRequest* req,
                                                            ::grpc::ServerWriter<ChannelEntry>* writer) {
  try {
    return WriteEntries(ctx, service_->GetChannelEntriesThatProvide(*req), writer);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetLatestChannelEntriesThatProvide(::grpc::ServerContext* ctx,
                                                                  const GetLatestProvidersRequest* req,
                                                                  ::grpc::ServerWriter<ChannelEntry>* writer) {
  try {
    return WriteEntries(ctx, service_->GetLatestChannelEntriesThatProvide(*req), writer);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetDefaultBundleThatProvides(::grpc::ServerContext*,
                                                            const GetDefaultProviderRequest* req,
                                                            Bundle* resp) {
  try {
    *resp = service_->GetDefaultBundleThatProvides(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListBundles(::grpc::ServerContext* ctx,
                                           const ListBundlesRequest*,
                                           ::grpc::ServerWriter<Bundle>* writer) {
  try {
    bool cancelled = false;
    service_->ListBundles([&](const Bundle& bundle) {
      if (ctx && ctx->IsCancelled()) {
        cancelled = true;
        return false;
      }
      return writer->Write(bundle);
    });
    if (cancelled) {
      return {::grpc::StatusCode::CANCELLED, "client cancelled stream"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
