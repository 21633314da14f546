#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <tuple>
#include <vector>

#include "internal/cache/cache.hpp"
#include "internal/cache/json_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using catalog::cache::Cache;
using catalog::model::GroupVersionKind;
namespace registry_v1 = catalog::registry::v1;

using EntryTuple = std::tuple<std::string, std::string, std::string, std::string>;

const GroupVersionKind kEtcdCluster{"etcd.database.coreos.com", "v1beta2", "EtcdCluster", ""};
const GroupVersionKind kEtcdBackup{"etcd.database.coreos.com", "v1beta2", "EtcdBackup", ""};

constexpr const char* kEtcdCatalog = R"({"schema":"olm.package","name":"etcd","defaultChannel":"stable"}
{"schema":"olm.channel","package":"etcd","name":"stable","entries":[
  {"name":"etcd.v2","replaces":"etcd.v1","skips":["etcd.v1-beta"]},
  {"name":"etcd.v1"}]}
{"schema":"olm.channel","package":"etcd","name":"alpha","entries":[{"name":"etcd.v1"}]}
{"schema":"olm.bundle","package":"etcd","name":"etcd.v1","image":"quay.io/etcd/etcd.v1","properties":[
  {"type":"olm.package","value":{"packageName":"etcd","version":"1.0.0"}},
  {"type":"olm.gvk","value":{"group":"etcd.database.coreos.com","kind":"EtcdCluster","version":"v1beta2"}}]}
{"schema":"olm.bundle","package":"etcd","name":"etcd.v2","image":"quay.io/etcd/etcd.v2","properties":[
  {"type":"olm.package","value":{"packageName":"etcd","version":"2.0.0"}},
  {"type":"olm.gvk","value":{"group":"etcd.database.coreos.com","kind":"EtcdCluster","version":"v1beta2"}},
  {"type":"olm.gvk","value":{"group":"etcd.database.coreos.com","kind":"EtcdBackup","version":"v1beta2"}}]}
)";

constexpr const char* kPromCatalog = R"(---
schema: olm.package
name: prom
defaultChannel: stable
---
schema: olm.channel
package: prom
name: stable
entries:
  - name: prom.v1
---
schema: olm.bundle
package: prom
name: prom.v1
image: quay.io/prom/prom.v1
properties:
  - type: olm.package
    value:
      packageName: prom
      version: "0.1.0"
  - type: olm.gvk
    value:
      group: monitoring.coreos.com
      kind: Prometheus
      version: v1
  - type: olm.gvk.required
    value:
      group: etcd.database.coreos.com
      kind: EtcdCluster
      version: v1beta2
)";

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "catalog_cache_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

fs::path WriteCatalog(const fs::path& dir) {
  const auto source = dir / "catalog";
  WriteFile(source / "etcd" / "catalog.json", kEtcdCatalog);
  WriteFile(source / "prom" / "catalog.yaml", kPromCatalog);
  return source;
}

std::vector<EntryTuple> Tuples(const std::vector<registry_v1::ChannelEntry>& entries) {
  std::vector<EntryTuple> out;
  for (const auto& entry : entries) {
    out.emplace_back(entry.package_name(), entry.channel_name(), entry.bundle_name(), entry.replaces());
  }
  return out;
}

template <typename Error, typename Fn>
std::string ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return {};
}

void TestBuildAndQuery() {
  const auto dir    = FreshDir("query");
  const auto source = WriteCatalog(dir);

  auto cache = catalog::cache::Open(dir / "cache");
  assert(cache->GetBackend().Name() == "compact");
  cache->Build(source);
  cache->Load();

  assert((cache->ListPackages() == std::vector<std::string>{"etcd", "prom"}));

  const auto package = cache->GetPackage("etcd");
  assert(package.default_channel_name() == "stable");
  assert(package.channels_size() == 2);
  assert(package.channels(0).name() == "alpha" && package.channels(0).csv_name() == "etcd.v1");
  assert(package.channels(1).name() == "stable" && package.channels(1).csv_name() == "etcd.v2");

  const auto bundle = cache->GetBundle("etcd", "stable", "etcd.v2");
  assert(bundle.version() == "2.0.0");
  assert(bundle.bundle_path() == "quay.io/etcd/etcd.v2");
  assert(bundle.provided_apis_size() == 2);
  assert(bundle.replaces().empty() && bundle.skips_size() == 0);

  assert(cache->GetBundleForChannel("prom", "stable").required_apis(0).kind() == "EtcdCluster");
  assert(cache->GetBundleThatReplaces("etcd.v1", "etcd", "stable").csv_name() == "etcd.v2");
  assert(cache->GetBundleThatReplaces("etcd.v1-beta", "etcd", "stable").csv_name() == "etcd.v2");

  assert((Tuples(cache->GetChannelEntriesThatReplace("etcd.v1")) == std::vector<EntryTuple>{{"etcd", "stable", "etcd.v2", "etcd.v1"}}));

  assert((Tuples(cache->GetChannelEntriesThatProvide(kEtcdCluster)) == std::vector<EntryTuple>{
                                                                          {"etcd", "alpha", "etcd.v1", ""},
                                                                          {"etcd", "stable", "etcd.v1", ""},
                                                                          {"etcd", "stable", "etcd.v2", "etcd.v1"},
                                                                          {"etcd", "stable", "etcd.v2", "etcd.v1-beta"},
                                                                      }));
  assert((Tuples(cache->GetLatestChannelEntriesThatProvide(kEtcdCluster)) == std::vector<EntryTuple>{
                                                                                {"etcd", "alpha", "etcd.v1", ""},
                                                                                {"etcd", "stable", "etcd.v2", "etcd.v1"},
                                                                            }));
  assert((Tuples(cache->GetLatestChannelEntriesThatProvide(kEtcdBackup)) == std::vector<EntryTuple>{{"etcd", "stable", "etcd.v2", "etcd.v1"}}));
  assert(cache->GetBundleThatProvides(kEtcdCluster).csv_name() == "etcd.v2");

  const auto listed = cache->ListBundles();
  assert(listed.size() == 4);
  assert(listed[2].csv_name() == "etcd.v2" && listed[2].replaces() == "etcd.v1");
  assert(listed[3].csv_name() == "prom.v1");
}

void TestNotFound() {
  const auto dir   = FreshDir("not_found");
  auto       cache = catalog::cache::Open(dir / "cache");
  cache->Build(WriteCatalog(dir));
  cache->Load();

  using catalog::util::NotFound;
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetPackage("nope"); }) == "package nope not found");
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetBundle("etcd", "stable", "etcd.v9"); }) == "no entry found for etcd stable etcd.v9");
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetBundleForChannel("etcd", "beta"); }) == "no entry found for etcd beta");
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetBundleForChannel("nope", "stable"); }) == "package nope not found");
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetBundleThatReplaces("etcd.v2", "etcd", "stable"); }) == "no entry found for etcd stable");
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetChannelEntriesThatReplace("etcd.v2"); }) == "no channel entries found that replace etcd.v2");

  const GroupVersionKind unknown{"example.com", "v1", "Widget", ""};
  assert(ExpectThrow<NotFound>([&] { (void)cache->GetChannelEntriesThatProvide(unknown); }) ==
         "no channel entries found that provide example.com v1 Widget");
  (void)ExpectThrow<NotFound>([&] { (void)cache->GetBundleThatProvides(unknown); });
}

void TestIntegrity() {
  const auto dir    = FreshDir("integrity");
  const auto source = WriteCatalog(dir);

  auto fresh = catalog::cache::Open(dir / "cache");
  assert(ExpectThrow<catalog::util::IntegrityError>([&] { fresh->CheckIntegrity(source); }) ==
         "cache requires rebuild: no compact cache present");
  fresh->Build(source);
  fresh.reset();

  auto reopened = catalog::cache::Open(dir / "cache");
  reopened->CheckIntegrity(source);

  WriteFile(source / "prom" / "catalog.yaml", std::string(kPromCatalog) + "---\nschema: olm.channel\npackage: prom\nname: fast\nentries:\n  - name: prom.v1\n");
  const auto message = ExpectThrow<catalog::util::IntegrityError>([&] { reopened->CheckIntegrity(source); });
  assert(message.rfind("cache requires rebuild: cache reports digest as \"", 0) == 0);
  assert(message.find("but computed digest is") != std::string::npos);

  reopened->LoadOrRebuild(source);
  reopened->CheckIntegrity(source);
  assert(reopened->GetPackage("prom").channels_size() == 2);
}

void TestLoadOrRebuildKeepsCurrentCache() {
  const auto dir    = FreshDir("keep");
  const auto source = WriteCatalog(dir);

  auto cache = catalog::cache::Open(dir / "cache");
  cache->LoadOrRebuild(source);
  const auto digest = cache->GetBackend().GetDigest();
  assert(!digest.empty());
  cache.reset();

  auto again = catalog::cache::Open(dir / "cache");
  again->LoadOrRebuild(source);
  assert(again->GetBackend().GetDigest() == digest);
  assert(again->ListPackages().size() == 2);
}

void TestBuildFailures() {
  const auto dir    = FreshDir("failures");
  const auto source = WriteCatalog(dir);

  std::stop_source stop;
  stop.request_stop();
  auto cancelled = catalog::cache::Open(dir / "cancelled");
  (void)ExpectThrow<std::runtime_error>([&] { cancelled->Build(source, stop.get_token()); });

  // a package whose channel names a bundle that was never declared
  WriteFile(source / "broken" / "catalog.json",
            R"({"schema":"olm.package","name":"broken","defaultChannel":"stable"}
{"schema":"olm.channel","package":"broken","name":"stable","entries":[{"name":"broken.v1"}]})");
  auto failing = catalog::cache::Open(dir / "failing");
  assert(ExpectThrow<catalog::util::GraphError>([&] { failing->Build(source); }) ==
         "bundle broken.v1 referenced by channel stable of package broken not found");
  (void)ExpectThrow<catalog::util::IntegrityError>([&] { failing->CheckIntegrity(source); });
}

void TestJsonLayout() {
  const auto dir    = FreshDir("json");
  const auto source = WriteCatalog(dir);

  {
    Cache cache(std::make_unique<catalog::cache::JsonBackend>(dir / "cache"));
    cache.Build(source);
    cache.Load();
    assert(cache.GetBundleForChannel("etcd", "alpha").csv_name() == "etcd.v1");
  }

  auto reopened = catalog::cache::Open(dir / "cache");
  assert(reopened->GetBackend().Name() == "json");
  reopened->CheckIntegrity(source);
  reopened->Load();
  assert(reopened->ListBundles().size() == 4);
}

fs::path WriteWideCatalog(const fs::path& dir) {
  auto source = WriteCatalog(dir);
  for (int i = 0; i < 12; ++i) {
    const auto package = "pkg" + std::to_string(i);
    std::string text   = R"({"schema":"olm.package","name":")" + package + R"(","defaultChannel":"stable"})" + "\n";
    text += R"({"schema":"olm.channel","package":")" + package + R"(","name":"stable","entries":[{"name":")" + package +
            R"(.v2","replaces":")" + package + R"(.v1"},{"name":")" + package + R"(.v1"}]})" + "\n";
    for (int v = 1; v <= 2; ++v) {
      const auto name = package + ".v" + std::to_string(v);
      text += R"({"schema":"olm.bundle","package":")" + package + R"(","name":")" + name + R"(","image":"quay.io/)" + package + "/" + name +
              R"(","properties":[{"type":"olm.package","value":{"packageName":")" + package + R"(","version":")" + std::to_string(v) +
              R"(.0.0"}}]})" + "\n";
    }
    WriteFile(source / package / "catalog.json", text);
  }
  return source;
}

void TestDigestIndependentOfConcurrency() {
  const auto dir    = FreshDir("concurrency");
  const auto source = WriteWideCatalog(dir);

  auto serial   = catalog::cache::Open(dir / "compact_serial");
  auto parallel = catalog::cache::Open(dir / "compact_parallel");
  serial->Build(source, {}, 1);
  parallel->Build(source, {}, 8);
  assert(serial->GetBackend().GetDigest() == parallel->GetBackend().GetDigest());
  serial->Load();
  parallel->Load();
  assert(serial->ListPackages() == parallel->ListPackages());
  assert(serial->ListPackages().size() == 14);

  Cache json_serial(std::make_unique<catalog::cache::JsonBackend>(dir / "json_serial"));
  Cache json_parallel(std::make_unique<catalog::cache::JsonBackend>(dir / "json_parallel"));
  json_serial.Build(source, {}, 1);
  json_parallel.Build(source, {}, 8);
  assert(json_serial.GetBackend().GetDigest() == json_parallel.GetBackend().GetDigest());
}

} // namespace

int main() {
  TestBuildAndQuery();
  TestNotFound();
  TestIntegrity();
  TestLoadOrRebuildKeepsCurrentCache();
  TestBuildFailures();
  TestJsonLayout();
  TestDigestIndependentOfConcurrency();

  std::cout << "catalog_unit_cache: pass\n";
  return 0;
}
