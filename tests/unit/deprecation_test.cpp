#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/model/properties.hpp"
#include "internal/registry/deprecator.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"
#include "internal/util/errors.hpp"

namespace {

using catalog::db::sqlite::SqliteDB;
using catalog::db::sqlite::SqliteStatement;
using catalog::model::Bundle;
using catalog::model::PackageManifest;
using catalog::registry::PackageDeprecator;
using catalog::registry::SqlLoader;
using catalog::registry::SqlQuerier;

std::shared_ptr<SqliteDB> FreshDb(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "catalog_deprecation_tests";
  std::filesystem::create_directories(base_dir);
  const auto path = base_dir / (test_name + ".db");
  std::filesystem::remove(path);
  return std::make_shared<SqliteDB>(path.string());
}

std::string PathOf(const std::string& package, const std::string& name) {
  return "quay.io/" + package + "/" + name;
}

Bundle MakeBundle(const std::string& name, const std::string& package, const std::string& version, const std::string& replaces = "") {
  Bundle bundle;
  bundle.name        = name;
  bundle.package     = package;
  bundle.version     = version;
  bundle.bundle_path = PathOf(package, name);
  bundle.replaces    = replaces;
  return bundle;
}

// etcd.v3 -> etcd.v2 -> etcd.v1; stable (default) is headed by v3, alpha by v2.
void LoadEtcd(SqlLoader& loader) {
  loader.AddBundle(MakeBundle("etcd.v1", "etcd", "1.0.0"));
  loader.AddBundle(MakeBundle("etcd.v2", "etcd", "2.0.0", "etcd.v1"));
  loader.AddBundle(MakeBundle("etcd.v3", "etcd", "3.0.0", "etcd.v2"));
  loader.AddPackageChannels(PackageManifest{"etcd", {{"stable", "etcd.v3"}, {"alpha", "etcd.v2"}}, "stable"});
}

bool IsDeprecated(const SqliteDB& db, const std::string& name) {
  SqliteStatement stmt(db, "SELECT 1 FROM deprecated WHERE operatorbundle_name=?;", {name});
  return stmt.Step();
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

void TestDeprecatingDefaultChannelHeadFails() {
  auto      db = FreshDb("default_head");
  SqlLoader loader(db);
  LoadEtcd(loader);

  (void)ExpectThrow<catalog::util::DefaultChannelHeadRemoval>([&] { loader.DeprecateBundle(PathOf("etcd", "etcd.v3")); });
  assert(!IsDeprecated(*db, "etcd.v3"));
  assert(SqlQuerier(db).GetPackage("etcd").channels_size() == 2);
}

void TestDeprecationTruncatesTail() {
  auto      db = FreshDb("truncate");
  SqlLoader loader(db);
  LoadEtcd(loader);

  loader.DeprecateBundle(PathOf("etcd", "etcd.v2"));

  SqlQuerier querier(db);
  const auto package = querier.GetPackage("etcd");
  assert(package.channels_size() == 1);
  assert(package.channels(0).name() == "stable");

  // v1 lived only in the truncated channels
  (void)ExpectThrow<catalog::util::NotFound>([&] { (void)querier.GetBundle("etcd", "stable", "etcd.v1"); });
  assert(!querier.GetBundleNameAndVersionForImage(PathOf("etcd", "etcd.v1")));

  // the named bundle stays, tombstoned
  assert(IsDeprecated(*db, "etcd.v2"));
  const auto properties = querier.GetPropertiesForBundle("etcd.v2");
  const auto deprecated = catalog::model::Property{std::string(catalog::model::kDeprecatedType), catalog::model::DeprecatedValue()};
  assert(std::find(properties.begin(), properties.end(), deprecated) != properties.end());
  assert(querier.GetBundleThatReplaces("etcd.v2", "etcd", "stable").csv_name() == "etcd.v3");

  (void)ExpectThrow<catalog::util::BundleImageNotFound>([&] { loader.DeprecateBundle(PathOf("etcd", "etcd.v1")); });
}

void TestDeprecatedHeadElidesChannelOnReload() {
  auto      db = FreshDb("elide");
  SqlLoader loader(db);
  LoadEtcd(loader);
  loader.DeprecateBundle(PathOf("etcd", "etcd.v2"));

  loader.AddPackageChannels(PackageManifest{"etcd", {{"stable", "etcd.v3"}, {"alpha", "etcd.v2"}}, "stable"});

  SqlQuerier querier(db);
  const auto package = querier.GetPackage("etcd");
  assert(package.channels_size() == 1);
  assert(package.default_channel_name() == "stable");
  assert(querier.GetBundleForChannel("etcd", "stable").csv_name() == "etcd.v3");
}

void TestTailMemberWithOutsideMembershipSurvives() {
  auto      db = FreshDb("outside_membership");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("m.v1", "m", "1.0.0"));
  loader.AddBundle(MakeBundle("m.v2", "m", "2.0.0", "m.v1"));
  loader.AddBundle(MakeBundle("m.v3", "m", "3.0.0", "m.v2"));
  loader.AddPackageChannels(PackageManifest{"m", {{"stable", "m.v3"}, {"fast", "m.v2"}, {"legacy", "m.v1"}}, "stable"});

  loader.DeprecateBundle(PathOf("m", "m.v2"));

  SqlQuerier querier(db);
  assert(querier.GetBundleForChannel("m", "legacy").csv_name() == "m.v1");
  (void)ExpectThrow<catalog::util::NotFound>([&] { (void)querier.GetBundle("m", "stable", "m.v1"); });
  assert(!IsDeprecated(*db, "m.v1"));
}

void TestPackageDeprecatorRequiresEveryHead() {
  auto      db = FreshDb("deprecator_refuses");
  SqlLoader loader(db);
  LoadEtcd(loader);
  SqlQuerier querier(db);

  PackageDeprecator deprecator(loader, querier);
  const auto        message = ExpectThrow<catalog::util::DefaultChannelHeadRemoval>([&] { deprecator.Deprecate({PathOf("etcd", "etcd.v3")}); });
  assert(message ==
         "cannot deprecate default channel head from package without removing all other channel heads in package etcd: must deprecate "
         "quay.io/etcd/etcd.v2, head of channel alpha");
  assert(querier.ListPackages().size() == 1);
}

void TestPackageDeprecatorRemovesFullyDeprecatedPackage() {
  auto      db = FreshDb("deprecator_removes");
  SqlLoader loader(db);
  LoadEtcd(loader);
  loader.AddBundle(MakeBundle("solo.v1", "solo", "1.0.0"));
  loader.AddPackageChannels(PackageManifest{"solo", {{"stable", "solo.v1"}}, "stable"});

  // single channel: its head is the default head
  (void)ExpectThrow<catalog::util::DefaultChannelHeadRemoval>([&] { loader.DeprecateBundle(PathOf("solo", "solo.v1")); });

  SqlQuerier        querier(db);
  PackageDeprecator deprecator(loader, querier);
  deprecator.Deprecate({PathOf("solo", "solo.v1")});
  assert((querier.ListPackages() == std::vector<std::string>{"etcd"}));
  assert(!querier.GetBundleNameAndVersionForImage(PathOf("solo", "solo.v1")));

  deprecator.Deprecate({PathOf("etcd", "etcd.v3"), PathOf("etcd", "etcd.v2")});
  assert(querier.ListPackages().empty());
}

void TestPackageDeprecatorSkipsTruncatedPaths() {
  auto      db = FreshDb("deprecator_skips");
  SqlLoader loader(db);
  LoadEtcd(loader);
  SqlQuerier querier(db);

  // v1 is gone once v2 is deprecated
  PackageDeprecator deprecator(loader, querier, catalog::registry::BatchMode::kStrict);
  deprecator.Deprecate({PathOf("etcd", "etcd.v2"), PathOf("etcd", "etcd.v1")});

  assert(IsDeprecated(*db, "etcd.v2"));
  assert(!IsDeprecated(*db, "etcd.v1"));
  assert(querier.GetPackage("etcd").channels_size() == 1);
}

} // namespace

int main() {
  TestDeprecatingDefaultChannelHeadFails();
  TestDeprecationTruncatesTail();
  TestDeprecatedHeadElidesChannelOnReload();
  TestTailMemberWithOutsideMembershipSurvives();
  TestPackageDeprecatorRequiresEveryHead();
  TestPackageDeprecatorRemovesFullyDeprecatedPackage();
  TestPackageDeprecatorSkipsTruncatedPaths();

  std::cout << "catalog_unit_deprecation: pass\n";
  return 0;
}
