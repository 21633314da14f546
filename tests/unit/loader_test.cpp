#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/model/properties.hpp"
#include "internal/registry/entry_writer.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"
#include "internal/util/errors.hpp"

namespace {

using catalog::db::sqlite::SqliteDB;
using catalog::db::sqlite::SqliteStatement;
using catalog::db::sqlite::SqliteTransaction;
using catalog::model::Bundle;
using catalog::model::PackageManifest;
using catalog::registry::LoaderOptions;
using catalog::registry::SqlLoader;
using catalog::registry::SqlQuerier;

std::shared_ptr<SqliteDB> FreshDb(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "catalog_loader_tests";
  std::filesystem::create_directories(base_dir);
  const auto path = base_dir / (test_name + ".db");
  std::filesystem::remove(path);
  return std::make_shared<SqliteDB>(path.string());
}

Bundle MakeBundle(const std::string& name, const std::string& package, const std::string& version, const std::string& replaces = "",
                  std::vector<std::string> skips = {}) {
  Bundle bundle;
  bundle.name        = name;
  bundle.package     = package;
  bundle.version     = version;
  bundle.bundle_path = "quay.io/" + package + "/" + name;
  bundle.replaces    = replaces;
  bundle.skips       = std::move(skips);
  return bundle;
}

PackageManifest SingleChannel(const std::string& package, const std::string& channel, const std::string& head) {
  return PackageManifest{package, {{channel, head}}, channel};
}

std::vector<int64_t> Depths(const SqliteDB& db, const std::string& package, const std::string& bundle) {
  SqliteStatement stmt(db, "SELECT depth FROM channel_entry WHERE package_name=? AND operatorbundle_name=? ORDER BY depth;", {package, bundle});
  std::vector<int64_t> out;
  while (stmt.Step()) out.push_back(stmt.Int64(0));
  return out;
}

int64_t Count(const SqliteDB& db, const std::string& sql) {
  SqliteStatement stmt(db, sql);
  assert(stmt.Step());
  return stmt.Int64(0);
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

void TestSkipSynthesisAndDepths() {
  auto      db = FreshDb("acme");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("acme.v1", "acme", "1.0.0"));
  loader.AddBundle(MakeBundle("acme.v2", "acme", "2.0.0", "acme.v1", {"acme.v1-rc1"}));
  loader.AddPackageChannels(SingleChannel("acme", "stable", "acme.v2"));

  SqlQuerier querier(db);
  assert(querier.GetBundleForChannel("acme", "stable").csv_name() == "acme.v2");
  assert(querier.GetBundleThatReplaces("acme.v1-rc1", "acme", "stable").csv_name() == "acme.v2");
  assert(querier.GetBundleThatReplaces("acme.v1", "acme", "stable").csv_name() == "acme.v2");

  assert((Depths(*db, "acme", "acme.v2") == std::vector<int64_t>{0, 1}));
  assert((Depths(*db, "acme", "acme.v1") == std::vector<int64_t>{1}));
  assert((Depths(*db, "acme", "acme.v1-rc1") == std::vector<int64_t>{1}));

  // the skipped placeholder never becomes a bundle row
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle WHERE name='acme.v1-rc1';") == 0);
}

void TestDepthIncreasesAlongReplacesChain() {
  auto      db = FreshDb("chain");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("etcd.v1", "etcd", "1.0.0"));
  loader.AddBundle(MakeBundle("etcd.v2", "etcd", "2.0.0", "etcd.v1"));
  loader.AddBundle(MakeBundle("etcd.v3", "etcd", "3.0.0", "etcd.v2"));
  loader.AddPackageChannels(SingleChannel("etcd", "stable", "etcd.v3"));

  assert((Depths(*db, "etcd", "etcd.v3") == std::vector<int64_t>{0}));
  assert((Depths(*db, "etcd", "etcd.v2") == std::vector<int64_t>{1}));
  assert((Depths(*db, "etcd", "etcd.v1") == std::vector<int64_t>{2}));

  // every real member on the walk is tagged with its package
  SqlQuerier querier(db);
  const auto properties = querier.GetPropertiesForBundle("etcd.v1");
  const auto expected   = catalog::model::Property{std::string(catalog::model::kPackageType), catalog::model::PackageValue("etcd", "1.0.0")};
  assert(std::find(properties.begin(), properties.end(), expected) != properties.end());
}

void TestCycleRollsBackWholePackage() {
  auto      db = FreshDb("cycle");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("cyc.a", "cyc", "1.0.0", "cyc.b"));
  loader.AddBundle(MakeBundle("cyc.b", "cyc", "2.0.0", "cyc.a"));

  const auto message = ExpectThrow<catalog::util::AggregateError>([&] { loader.AddPackageChannels(SingleChannel("cyc", "stable", "cyc.a")); });
  assert(message == "channel stable of package cyc: Cycle detected, cyc.b replaces cyc.a");

  assert(Count(*db, "SELECT COUNT(*) FROM channel_entry;") == 0);
  assert(Count(*db, "SELECT COUNT(*) FROM channel;") == 0);
  assert(SqlQuerier(db).ListPackages().empty());
}

void TestReplacesTargetMustExist() {
  auto      db = FreshDb("dangling");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("x.v2", "x", "2.0.0", "x.v1"));
  const auto message = ExpectThrow<catalog::util::AggregateError>([&] { loader.AddPackageChannels(SingleChannel("x", "stable", "x.v2")); });
  assert(message == "channel stable of package x: Invalid bundle x.v2, replaces nonexistent bundle x.v1");
}

void TestMissingHeadBundleAndDefaultChannel() {
  auto      db = FreshDb("missing_head");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("y.v1", "y", "1.0.0"));
  PackageManifest manifest{"y", {{"stable", "y.v1"}, {"beta", "y.v9"}}, ""};

  bool threw = false;
  try {
    loader.AddPackageChannels(manifest);
  } catch (const catalog::util::AggregateError& e) {
    threw              = true;
    const auto& errors = e.Messages();
    assert(errors.size() == 2);
    assert(errors[0] == "no default channel specified for y");
    assert(errors[1] == "channel beta of package y: no bundle found for y.v9");
  }
  assert(threw);
}

void TestAlphaFeatureGating() {
  auto      db = FreshDb("alpha_disabled");
  SqlLoader loader(db);

  auto substitute            = MakeBundle("z.v1-sub", "z", "1.0.1");
  substitute.substitutes_for = "z.v1";

  const auto message = ExpectThrow<catalog::util::UnsupportedFeature>([&] { loader.AddBundle(substitute); });
  assert(message == "SubstitutesFor is an alpha-only feature. You must enable alpha features in order to use this feature.");
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle;") == 0);
}

void TestSubstitutesForRedirectsReplaces() {
  auto      db = FreshDb("alpha_enabled");
  SqlLoader loader(db, LoaderOptions{true});

  loader.AddBundle(MakeBundle("z.v1", "z", "1.0.0"));
  loader.AddBundle(MakeBundle("z.v2", "z", "2.0.0", "z.v1"));

  auto substitute            = MakeBundle("z.v1-sub", "z", "1.0.1", "", {"z.v0"});
  substitute.substitutes_for = "z.v1";
  loader.AddBundle(substitute);

  {
    SqliteStatement stmt(*db, "SELECT replaces FROM operatorbundle WHERE name='z.v2';");
    assert(stmt.Step());
    assert(stmt.Text(0) == "z.v1-sub");
  }
  {
    SqliteStatement stmt(*db, "SELECT skips FROM operatorbundle WHERE name='z.v1-sub';");
    assert(stmt.Step());
    assert((catalog::registry::SplitSkips(stmt.Text(0)) == std::vector<std::string>{"z.v0", "z.v1"}));
  }

  auto second            = MakeBundle("z.v1-sub2", "z", "1.0.2");
  second.substitutes_for = "z.v1";
  (void)ExpectThrow<catalog::util::InvalidState>([&] { loader.AddBundle(second); });
}

void TestAddBundleRejectsDuplicatesAndEmptyNames() {
  auto      db = FreshDb("duplicates");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("d.v1", "d", "1.0.0"));
  (void)ExpectThrow<catalog::util::AlreadyExists>([&] { loader.AddBundle(MakeBundle("d.v1", "d", "1.0.0")); });
  (void)ExpectThrow<catalog::util::InvalidState>([&] { loader.AddBundle(MakeBundle("", "d", "1.0.0")); });
}

void TestFactsAreDeduplicated() {
  auto      db = FreshDb("facts");
  SqlLoader loader(db);

  const catalog::model::GroupVersionKind widget{"example.com", "v1", "Widget", "widgets"};
  const catalog::model::GroupVersionKind gadget{"example.com", "v1", "Gadget", "gadgets"};

  auto bundle          = MakeBundle("f.v1", "f", "1.0.0");
  bundle.provided_apis = {widget, widget};
  bundle.properties    = {{"olm.label", "\"a\""}, {"olm.label", "\"a\""}, {std::string(catalog::model::kGvkType), catalog::model::GvkValue(widget)}};
  bundle.required_apis = {gadget};
  bundle.dependencies  = {{std::string(catalog::model::kGvkType), catalog::model::GvkValue(gadget)}};
  bundle.related_images = {"quay.io/f/operand:1", "quay.io/f/operand:1"};
  loader.AddBundle(bundle);
  loader.AddPackageChannels(SingleChannel("f", "stable", "f.v1"));

  SqlQuerier querier(db);
  const auto properties = querier.GetPropertiesForBundle("f.v1");
  assert(std::count(properties.begin(), properties.end(), catalog::model::Property{"olm.label", "\"a\""}) == 1);
  assert(std::count_if(properties.begin(), properties.end(), [](const auto& p) { return p.type == catalog::model::kGvkType; }) == 1);

  const auto dependencies = querier.GetDependenciesForBundle("f.v1");
  assert(dependencies.size() == 1);
  assert(dependencies[0].value == catalog::model::GvkValue(gadget));

  const auto fetched = querier.GetBundle("f", "stable", "f.v1");
  assert(fetched.provided_apis_size() == 1);
  assert(fetched.provided_apis(0).kind() == "Widget");
  assert(fetched.required_apis_size() == 1);
  assert(fetched.required_apis(0).kind() == "Gadget");

  assert((querier.GetImagesForBundle("f.v1") == std::vector<std::string>{"quay.io/f/f.v1", "quay.io/f/operand:1"}));
}

void TestAddBundlePackageChannelsIsAtomic() {
  auto      db = FreshDb("atomic");
  SqlLoader loader(db);

  loader.AddBundlePackageChannels(SingleChannel("g", "stable", "g.v1"), MakeBundle("g.v1", "g", "1.0.0"));

  // head does not exist in the store, so the bundle insert rolls back too
  (void)ExpectThrow<catalog::util::AggregateError>(
      [&] { loader.AddBundlePackageChannels(SingleChannel("g", "stable", "g.v3"), MakeBundle("g.v2", "g", "2.0.0", "g.v1")); });
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle WHERE name='g.v2';") == 0);

  loader.AddBundlePackageChannels(SingleChannel("g", "stable", "g.v2"), MakeBundle("g.v2", "g", "2.0.0", "g.v1"));
  assert(SqlQuerier(db).GetCurrentCSVNameForChannel("g", "stable") == "g.v2");
}

void TestRemovePackageAndStrandedBundles() {
  auto      db = FreshDb("remove");
  SqlLoader loader(db);

  loader.AddBundle(MakeBundle("r.v1", "r", "1.0.0"));
  loader.AddBundle(MakeBundle("r.v2", "r", "2.0.0", "r.v1"));
  loader.AddPackageChannels(SingleChannel("r", "stable", "r.v2"));
  loader.AddBundle(MakeBundle("keep.v1", "keep", "1.0.0"));
  loader.AddPackageChannels(SingleChannel("keep", "stable", "keep.v1"));

  loader.RemovePackage("r");
  SqlQuerier querier(db);
  assert((querier.ListPackages() == std::vector<std::string>{"keep"}));
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle WHERE name LIKE 'r.%';") == 0);
  assert(Count(*db, "SELECT COUNT(*) FROM properties WHERE operatorbundle_name LIKE 'r.%';") == 0);

  const auto message = ExpectThrow<catalog::util::NotFound>([&] { loader.RemovePackage("r"); });
  assert(message == "package r not found");

  loader.AddBundle(MakeBundle("orphan.v1", "orphan", "1.0.0"));
  loader.RemoveStrandedBundles();
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle WHERE name='orphan.v1';") == 0);
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle WHERE name='keep.v1';") == 1);
}

void TestClearNonHeadBundlesDropsManifests() {
  auto      db = FreshDb("clear_non_head");
  SqlLoader loader(db);

  auto v1     = MakeBundle("c.v1", "c", "1.0.0");
  v1.csv_json = R"({"kind":"ClusterServiceVersion","metadata":{"name":"c.v1"}})";
  v1.objects  = {v1.csv_json};
  auto v2     = MakeBundle("c.v2", "c", "2.0.0", "c.v1");
  v2.csv_json = R"({"kind":"ClusterServiceVersion","metadata":{"name":"c.v2"}})";
  v2.objects  = {v2.csv_json};
  loader.AddBundle(v1);
  loader.AddBundle(v2);
  loader.AddPackageChannels(SingleChannel("c", "stable", "c.v2"));

  SqlQuerier querier(db);
  assert(querier.GetBundle("c", "stable", "c.v1").csv_json() == v1.csv_json);

  loader.ClearNonHeadBundles();
  assert(querier.GetBundle("c", "stable", "c.v1").csv_json().empty());
  assert(querier.GetBundle("c", "stable", "c.v1").object_size() == 0);
  assert(querier.GetBundle("c", "stable", "c.v2").csv_json() == v2.csv_json);
}

void TestConcurrentAddBundle() {
  auto      db = FreshDb("concurrent");
  SqlLoader loader(db);

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 6;

  std::atomic<int>         failures{0};
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      const std::string package = "p" + std::to_string(t);
      std::string       previous;
      for (int i = 0; i < kPerThread; ++i) {
        const std::string name = package + ".v" + std::to_string(i);
        try {
          loader.AddBundle(MakeBundle(name, package, std::to_string(i) + ".0.0", previous));
        } catch (const std::exception& e) {
          std::cerr << name << ": " << e.what() << "\n";
          failures.fetch_add(1);
        }
        previous = name;
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(failures.load() == 0);
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle;") == kThreads * kPerThread);

  for (int t = 0; t < kThreads; ++t) {
    const std::string package = "p" + std::to_string(t);
    loader.AddPackageChannels(SingleChannel(package, "stable", package + ".v" + std::to_string(kPerThread - 1)));
    assert((Depths(*db, package, package + ".v0") == std::vector<int64_t>{kPerThread - 1}));
  }
}

void TestUncommittedWritesStayInvisible() {
  auto      db = FreshDb("isolation");
  SqlLoader loader(db);

  {
    SqliteTransaction tx(*db);
    tx.DB().Exec("INSERT INTO operatorbundle(name) VALUES('i.v1');");
    assert(Count(tx.DB(), "SELECT COUNT(*) FROM operatorbundle;") == 1);
    assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle;") == 0);
  }
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle;") == 0);

  {
    SqliteTransaction tx(*db);
    tx.DB().Exec("INSERT INTO operatorbundle(name) VALUES('i.v1');");
    tx.Commit();
  }
  assert(Count(*db, "SELECT COUNT(*) FROM operatorbundle;") == 1);
}

} // namespace

int main() {
  TestSkipSynthesisAndDepths();
  TestDepthIncreasesAlongReplacesChain();
  TestCycleRollsBackWholePackage();
  TestReplacesTargetMustExist();
  TestMissingHeadBundleAndDefaultChannel();
  TestAlphaFeatureGating();
  TestSubstitutesForRedirectsReplaces();
  TestAddBundleRejectsDuplicatesAndEmptyNames();
  TestFactsAreDeduplicated();
  TestAddBundlePackageChannelsIsAtomic();
  TestRemovePackageAndStrandedBundles();
  TestClearNonHeadBundlesDropsManifests();
  TestConcurrentAddBundle();
  TestUncommittedWritesStayInvisible();

  std::cout << "catalog_unit_loader: pass\n";
  return 0;
}
