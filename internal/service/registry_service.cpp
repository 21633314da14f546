#include "registry_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace catalog::service {

using namespace catalog::registry::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  catalog::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("catalog.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record = [&](bool success) {
    catalog::observability::Metrics::Instance().RecordRequest(route, success);
    catalog::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const catalog::util::NotFound& ex) {
    // Misses are ordinary answers for a catalog, not server faults.
    span.RecordException(ex.what());
    CATALOG_LOG_DEBUG("RPC miss", {catalog::observability::StringField("route", route), catalog::observability::StringField("error", ex.what())});
    record(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CATALOG_LOG_ERROR("RPC failed", {catalog::observability::StringField("route", route), catalog::observability::StringField("error", ex.what()),
                                     catalog::observability::StringField("subject", subject)});
    record(false);
    throw;
  }
}

catalog::model::GroupVersionKind ToGvk(const std::string& group, const std::string& version, const std::string& kind, const std::string& plural) {
  return {group, version, kind, plural};
}

void RequireQuery(const ServiceContext& ctx) {
  if (!ctx.query) {
    throw std::runtime_error("registry service has no query backend");
  }
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  RequireQuery(ctx_);
}

std::vector<std::string> RegistryService::ListPackages() {
  return ObserveRpc("Registry.ListPackages", "", [&] { return ctx_.query->ListPackages(); });
}

Package RegistryService::GetPackage(const GetPackageRequest& req) {
  return ObserveRpc("Registry.GetPackage", req.name(), [&] { return ctx_.query->GetPackage(req.name()); });
}

Bundle RegistryService::GetBundle(const GetBundleRequest& req) {
  return ObserveRpc("Registry.GetBundle", req.csv_name(),
                    [&] { return ctx_.query->GetBundle(req.pkg_name(), req.channel_name(), req.csv_name()); });
}

Bundle RegistryService::GetBundleForChannel(const GetBundleInChannelRequest& req) {
  return ObserveRpc("Registry.GetBundleForChannel", req.pkg_name(),
                    [&] { return ctx_.query->GetBundleForChannel(req.pkg_name(), req.channel_name()); });
}

std::vector<ChannelEntry> RegistryService::GetChannelEntriesThatReplace(const GetAllReplacementsRequest& req) {
  return ObserveRpc("Registry.GetChannelEntriesThatReplace", req.csv_name(),
                    [&] { return ctx_.query->GetChannelEntriesThatReplace(req.csv_name()); });
}

Bundle RegistryService::GetBundleThatReplaces(const GetReplacementRequest& req) {
  return ObserveRpc("Registry.GetBundleThatReplaces", req.csv_name(),
                    [&] { return ctx_.query->GetBundleThatReplaces(req.csv_name(), req.pkg_name(), req.channel_name()); });
}

std::vector<ChannelEntry> RegistryService::GetChannelEntriesThatProvide(const GetAllProvidersRequest& req) {
  const auto gvk = ToGvk(req.group(), req.version(), req.kind(), req.plural());
  return ObserveRpc("Registry.GetChannelEntriesThatProvide", catalog::registry::Describe(gvk),
                    [&] { return ctx_.query->GetChannelEntriesThatProvide(gvk); });
}

std::vector<ChannelEntry> RegistryService::GetLatestChannelEntriesThatProvide(const GetLatestProvidersRequest& req) {
  const auto gvk = ToGvk(req.group(), req.version(), req.kind(), req.plural());
  return ObserveRpc("Registry.GetLatestChannelEntriesThatProvide", catalog::registry::Describe(gvk),
                    [&] { return ctx_.query->GetLatestChannelEntriesThatProvide(gvk); });
}

Bundle RegistryService::GetDefaultBundleThatProvides(const GetDefaultProviderRequest& req) {
  const auto gvk = ToGvk(req.group(), req.version(), req.kind(), req.plural());
  return ObserveRpc("Registry.GetDefaultBundleThatProvides", catalog::registry::Describe(gvk),
                    [&] { return ctx_.query->GetBundleThatProvides(gvk); });
}

void RegistryService::ListBundles(const catalog::registry::BundleSender& send) {
  ObserveRpc("Registry.ListBundles", "", [&] { ctx_.query->SendBundles(send); });
}

}
