#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using catalog::db::sqlite::SqliteDB;
using catalog::model::Bundle;
using catalog::model::PackageManifest;
using catalog::registry::SqlLoader;
using catalog::registry::SqlQuerier;
using catalog::service::RegistryService;
using catalog::service::ServiceContext;
namespace v1 = catalog::registry::v1;

const catalog::model::GroupVersionKind kEtcdCluster{"etcd.database.coreos.com", "v1beta2", "EtcdCluster", "etcdclusters"};

std::shared_ptr<RegistryService> MakeService(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "catalog_registry_service_tests";
  std::filesystem::create_directories(base_dir);
  const auto path = base_dir / (test_name + ".db");
  std::filesystem::remove(path);

  auto      db = std::make_shared<SqliteDB>(path.string());
  SqlLoader loader(db);

  Bundle v1;
  v1.name          = "etcd.v1";
  v1.package       = "etcd";
  v1.version       = "1.0.0";
  v1.bundle_path   = "quay.io/etcd/etcd.v1";
  v1.provided_apis = {kEtcdCluster};
  loader.AddBundle(v1);

  Bundle v2      = v1;
  v2.name        = "etcd.v2";
  v2.version     = "2.0.0";
  v2.bundle_path = "quay.io/etcd/etcd.v2";
  v2.replaces    = "etcd.v1";
  loader.AddBundle(v2);
  loader.AddPackageChannels(PackageManifest{"etcd", {{"stable", "etcd.v2"}}, "stable"});

  return std::make_shared<RegistryService>(ServiceContext{std::make_shared<SqlQuerier>(db)});
}

void TestServiceRequiresQuery() {
  bool threw = false;
  try {
    RegistryService service(ServiceContext{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestServiceTranslatesRequests() {
  auto service = MakeService("service");

  assert((service->ListPackages() == std::vector<std::string>{"etcd"}));

  v1::GetReplacementRequest replacement;
  replacement.set_csv_name("etcd.v1");
  replacement.set_pkg_name("etcd");
  replacement.set_channel_name("stable");
  assert(service->GetBundleThatReplaces(replacement).csv_name() == "etcd.v2");

  v1::GetAllReplacementsRequest all_replacements;
  all_replacements.set_csv_name("etcd.v1");
  const auto replacing = service->GetChannelEntriesThatReplace(all_replacements);
  assert(replacing.size() == 1 && replacing[0].bundle_name() == "etcd.v2");

  v1::GetLatestProvidersRequest latest;
  latest.set_group(kEtcdCluster.group);
  latest.set_version(kEtcdCluster.version);
  latest.set_kind(kEtcdCluster.kind);
  const auto providers = service->GetLatestChannelEntriesThatProvide(latest);
  assert(providers.size() == 1);
  assert(providers[0].bundle_name() == "etcd.v2");
  assert(providers[0].replaces() == "etcd.v1");

  v1::GetDefaultProviderRequest default_provider;
  default_provider.set_group(kEtcdCluster.group);
  default_provider.set_version(kEtcdCluster.version);
  default_provider.set_kind(kEtcdCluster.kind);
  assert(service->GetDefaultBundleThatProvides(default_provider).csv_name() == "etcd.v2");

  std::vector<std::string> listed;
  service->ListBundles([&listed](const v1::Bundle& bundle) {
    listed.push_back(bundle.csv_name());
    return true;
  });
  assert((listed == std::vector<std::string>{"etcd.v1", "etcd.v2"}));

  v1::GetPackageRequest missing;
  missing.set_name("nope");
  bool threw = false;
  try {
    (void)service->GetPackage(missing);
  } catch (const catalog::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestServerMapsOutcomesToStatus() {
  catalog::grpc::RegistryServer server(MakeService("server"));
  ::grpc::ServerContext         ctx;

  v1::GetBundleInChannelRequest head_request;
  head_request.set_pkg_name("etcd");
  head_request.set_channel_name("stable");
  v1::Bundle head;
  const auto ok = server.GetBundleForChannel(&ctx, &head_request, &head);
  assert(ok.ok());
  assert(head.csv_name() == "etcd.v2");
  assert(head.replaces().empty());

  v1::GetPackageRequest package_request;
  package_request.set_name("etcd");
  v1::Package package;
  assert(server.GetPackage(&ctx, &package_request, &package).ok());
  assert(package.default_channel_name() == "stable");

  package_request.set_name("nope");
  const auto missing = server.GetPackage(&ctx, &package_request, &package);
  assert(missing.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(missing.error_message() == "package nope not found");

  v1::GetBundleRequest bundle_request;
  bundle_request.set_pkg_name("etcd");
  bundle_request.set_channel_name("stable");
  bundle_request.set_csv_name("etcd.v9");
  v1::Bundle bundle;
  assert(server.GetBundle(&ctx, &bundle_request, &bundle).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::GetDefaultProviderRequest provider_request;
  provider_request.set_group("example.com");
  provider_request.set_version("v1");
  provider_request.set_kind("Widget");
  assert(server.GetDefaultBundleThatProvides(&ctx, &provider_request, &bundle).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestServiceRequiresQuery();
  TestServiceTranslatesRequests();
  TestServerMapsOutcomesToStatus();

  std::cout << "catalog_unit_registry_service: pass\n";
  return 0;
}
