#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/backend.hpp"
#include "internal/cache/digest.hpp"
#include "internal/cache/json_backend.hpp"
#include "internal/cache/sqlite_kv_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using catalog::cache::Backend;
using catalog::cache::BundleKey;
using catalog::cache::JsonBackend;
using catalog::cache::SqliteKvBackend;
namespace registry_v1 = catalog::registry::v1;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "catalog_cache_backend_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

fs::path WriteSource(const fs::path& dir) {
  const auto source = dir / "source";
  WriteFile(source / "etcd" / "catalog.json", R"({"schema":"olm.package","name":"etcd","defaultChannel":"stable"})");
  return source;
}

registry_v1::Bundle MakeBundle(const std::string& name, const std::string& path) {
  registry_v1::Bundle bundle;
  bundle.set_csv_name(name);
  bundle.set_package_name("etcd");
  bundle.set_channel_name("stable");
  bundle.set_bundle_path(path);
  bundle.set_csv_json(R"({"kind":"ClusterServiceVersion"})");
  bundle.add_object(R"({"kind":"CustomResourceDefinition"})");
  bundle.set_replaces("etcd.v0");
  return bundle;
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

// Behavior every layout shares.
void ExerciseBackend(Backend& backend, const fs::path& source) {
  backend.Init();
  assert(backend.GetDigest().empty());

  backend.PutBundle(BundleKey{"etcd", "stable", "etcd.v1"}, MakeBundle("etcd.v1", "quay.io/etcd/etcd.v1"));
  backend.PutBundle(BundleKey{"etcd", "stable", "etcd.v2"}, MakeBundle("etcd.v2", ""));

  const auto stored = backend.GetBundle(BundleKey{"etcd", "stable", "etcd.v1"});
  assert(stored.csv_name() == "etcd.v1");
  assert(stored.replaces() == "etcd.v0");
  assert(stored.object_size() == 1);
  (void)ExpectThrow<catalog::util::NotFound>([&] { (void)backend.GetBundle(BundleKey{"etcd", "stable", "etcd.v9"}); });
  (void)ExpectThrow<std::runtime_error>([&] { (void)backend.GetBundle(BundleKey{"etcd", "..", "etcd.v1"}); });

  catalog::cache::v1::PackageIndex index;
  auto*                            package = index.add_packages();
  package->set_name("etcd");
  package->set_default_channel("stable");
  auto* channel = package->add_channels();
  channel->set_name("stable");
  channel->set_head("etcd.v2");
  backend.PutPackageIndex(index);
  const auto loaded = backend.GetPackageIndex();
  assert(loaded.packages_size() == 1);
  assert(loaded.packages(0).channels(0).head() == "etcd.v2");

  // listed bundles keep content only when there is no image to pull it from
  std::vector<registry_v1::Bundle> listed;
  backend.SendBundles([&listed](const registry_v1::Bundle& bundle) {
    listed.push_back(bundle);
    return true;
  });
  assert(listed.size() == 2);
  assert(listed[0].csv_name() == "etcd.v1");
  assert(listed[0].csv_json().empty() && listed[0].object_size() == 0);
  assert(!listed[1].csv_json().empty() && listed[1].object_size() == 1);

  int sent = 0;
  backend.SendBundles([&sent](const registry_v1::Bundle&) { return ++sent < 1; });
  assert(sent == 1);

  const auto digest = backend.ComputeDigest(source);
  assert(digest.size() == 64);
  assert(backend.ComputeDigest(source) == digest);
  backend.PutDigest(digest);
  assert(backend.GetDigest() == digest);
  assert(backend.IsCachePresent());

  // both the source and the stored content feed the digest
  WriteFile(source / "etcd" / "extra.json", R"({"schema":"olm.channel","package":"etcd","name":"fast"})");
  const auto source_changed = backend.ComputeDigest(source);
  assert(source_changed != digest);

  backend.PutBundle(BundleKey{"etcd", "stable", "etcd.v3"}, MakeBundle("etcd.v3", ""));
  assert(backend.ComputeDigest(source) != source_changed);

  fs::remove(source / "etcd" / "extra.json");
}

void TestSha256() {
  catalog::cache::Sha256 plain;
  plain.Update("abc");
  assert(plain.HexDigest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  catalog::cache::Sha256 left;
  left.Field("ab");
  left.Field("c");
  catalog::cache::Sha256 right;
  right.Field("a");
  right.Field("bc");
  assert(left.HexDigest() != right.HexDigest());
}

void TestSelectBackend() {
  const auto dir = FreshDir("select");

  assert(catalog::cache::SelectBackend(dir / "missing")->Name() == "compact");
  assert(catalog::cache::SelectBackend(dir)->Name() == "compact");

  const auto json_dir = dir / "json";
  JsonBackend(json_dir).Init();
  JsonBackend(json_dir).PutDigest("0");
  assert(catalog::cache::SelectBackend(json_dir)->Name() == "json");

  const auto compact_dir = dir / "compact";
  {
    SqliteKvBackend backend(compact_dir);
    backend.Init();
    backend.Close();
  }
  assert(catalog::cache::SelectBackend(compact_dir)->Name() == "compact");

  // both layouts at once, or neither
  JsonBackend(compact_dir).Init();
  JsonBackend(compact_dir).PutDigest("0");
  const auto message = ExpectThrow<std::runtime_error>([&] { (void)catalog::cache::SelectBackend(compact_dir); });
  assert(message.find("unexpected contents") != std::string::npos);

  const auto stray_dir = dir / "stray";
  WriteFile(stray_dir / "notes.txt", "hello");
  (void)ExpectThrow<std::runtime_error>([&] { (void)catalog::cache::SelectBackend(stray_dir); });
}

void TestValidateKeyPart() {
  for (const std::string bad : {"", ".", "..", "a/b", "a\\b"}) {
    (void)ExpectThrow<std::runtime_error>([&] { catalog::cache::ValidateKeyPart(bad); });
  }
  catalog::cache::ValidateKeyPart("etcd.v1");
  catalog::cache::ValidateKeyPart("my-operator_v1.2.3");
}

void TestCompactBackend() {
  const auto      dir = FreshDir("compact");
  SqliteKvBackend backend(dir / "cache");
  assert(!backend.IsCachePresent());
  ExerciseBackend(backend, WriteSource(dir));

  // closed backends refuse to serve
  backend.Close();
  (void)ExpectThrow<std::runtime_error>([&] { (void)backend.GetPackageIndex(); });
  backend.Open();
  assert(backend.GetPackageIndex().packages_size() == 1);
}

void TestJsonBackend() {
  const auto  dir = FreshDir("json");
  JsonBackend backend(dir / "cache");
  assert(!backend.IsCachePresent());
  ExerciseBackend(backend, WriteSource(dir));

  assert(fs::exists(dir / "cache" / "cache" / "etcd_stable_etcd.v1.json"));
  assert(fs::exists(dir / "cache" / "cache" / "packages.json"));

  // Init discards the previous layout
  backend.Init();
  (void)ExpectThrow<catalog::util::NotFound>([&] { (void)backend.GetBundle(BundleKey{"etcd", "stable", "etcd.v1"}); });
  assert(backend.GetDigest().empty());
}

// Keys whose parts only differ in where an underscore falls stay distinct.
void ExpectUnderscoreKeysDistinct(Backend& backend) {
  backend.Init();
  const BundleKey first{"a_b", "c", "d"};
  const BundleKey second{"a", "b_c", "d"};
  const BundleKey third{"a", "b", "c_d"};
  backend.PutBundle(first, MakeBundle("first", ""));
  backend.PutBundle(second, MakeBundle("second", ""));
  backend.PutBundle(third, MakeBundle("third", ""));
  assert(backend.GetBundle(first).csv_name() == "first");
  assert(backend.GetBundle(second).csv_name() == "second");
  assert(backend.GetBundle(third).csv_name() == "third");
  (void)ExpectThrow<catalog::util::NotFound>([&] { (void)backend.GetBundle(BundleKey{"a", "b", "c%5Fd"}); });
}

void TestUnderscoreKeys() {
  const auto dir = FreshDir("underscores");

  JsonBackend json(dir / "json");
  ExpectUnderscoreKeysDistinct(json);
  assert(fs::exists(dir / "json" / "cache" / "a%5Fb_c_d.json"));

  SqliteKvBackend compact(dir / "compact");
  ExpectUnderscoreKeysDistinct(compact);
}

} // namespace

int main() {
  TestSha256();
  TestSelectBackend();
  TestValidateKeyPart();
  TestCompactBackend();
  TestJsonBackend();
  TestUnderscoreKeys();

  std::cout << "catalog_unit_cache_backend: pass\n";
  return 0;
}
