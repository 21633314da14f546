#include "internal/cache/sqlite_kv_backend.hpp"

#include <stdexcept>
#include <vector>

#include "internal/cache/digest.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/declcfg/declcfg.hpp"
#include "internal/util/errors.hpp"

namespace catalog::cache {

using db::sqlite::SqliteStatement;

namespace {

constexpr const char* kPackagesKey   = "packages.json";
constexpr const char* kBundlesPrefix = "bundles/";

constexpr const char* CREATE_KV       = "CREATE TABLE IF NOT EXISTS kv(key TEXT PRIMARY KEY, value BLOB NOT NULL);";
constexpr const char* UPSERT_KV       = "INSERT OR REPLACE INTO kv(key, value) VALUES(?, ?);";
constexpr const char* SELECT_KV       = "SELECT value FROM kv WHERE key=?;";
constexpr const char* SELECT_ALL_KV   = "SELECT key, value FROM kv ORDER BY key;";
constexpr const char* SELECT_BUNDLES  = "SELECT value FROM kv WHERE key >= 'bundles/' AND key < 'bundles0' ORDER BY key;";

std::string BundleKeyString(const BundleKey& key) {
  ValidateKeyPart(key.package);
  ValidateKeyPart(key.channel);
  ValidateKeyPart(key.name);
  return std::string(kBundlesPrefix) + key.package + "/" + key.channel + "/" + key.name;
}

} // namespace

SqliteKvBackend::SqliteKvBackend(std::filesystem::path base) : base_(std::move(base)) {
}

bool SqliteKvBackend::IsCachePresent() const {
  return std::filesystem::is_directory(Root()) && std::filesystem::is_regular_file(Root() / "db");
}

void SqliteKvBackend::Init() {
  Close();
  std::filesystem::remove_all(Root());
  std::filesystem::create_directories(Root());
  Open();
}

void SqliteKvBackend::Open() {
  std::lock_guard lock(mutex_);
  db_ = std::make_shared<db::sqlite::SqliteDB>((Root() / "db").string());
  db_->Exec(CREATE_KV);
}

void SqliteKvBackend::Close() {
  std::lock_guard lock(mutex_);
  db_.reset();
}

db::sqlite::SqliteDB& SqliteKvBackend::DB() const {
  if (!db_) {
    throw std::runtime_error("compact cache at " + Root().string() + " is not open");
  }
  return *db_;
}

void SqliteKvBackend::Put(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  SqliteStatement stmt(DB(), UPSERT_KV, {key, db::sql::Blob{value}});
  stmt.Run();
}

std::optional<std::string> SqliteKvBackend::Get(const std::string& key) const {
  std::lock_guard lock(mutex_);
  SqliteStatement stmt(DB(), SELECT_KV, {key});
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.Blob(0);
}

v1::PackageIndex SqliteKvBackend::GetPackageIndex() const {
  auto bytes = Get(kPackagesKey);
  if (!bytes) {
    throw std::runtime_error("compact cache has no package index");
  }
  v1::PackageIndex index;
  if (!index.ParseFromString(*bytes)) {
    throw std::runtime_error("compact cache package index is corrupt");
  }
  return index;
}

void SqliteKvBackend::PutPackageIndex(const v1::PackageIndex& index) {
  Put(kPackagesKey, SerializeDeterministic(index));
}

registry::v1::Bundle SqliteKvBackend::GetBundle(const BundleKey& key) const {
  const auto name  = BundleKeyString(key);
  auto       bytes = Get(name);
  if (!bytes) {
    throw util::NotFound("no entry found for " + key.package + " " + key.channel + " " + key.name);
  }
  registry::v1::Bundle bundle;
  if (!bundle.ParseFromString(*bytes)) {
    throw std::runtime_error("compact cache entry " + name + " is corrupt");
  }
  return bundle;
}

void SqliteKvBackend::PutBundle(const BundleKey& key, const registry::v1::Bundle& bundle) {
  Put(BundleKeyString(key), SerializeDeterministic(bundle));
}

std::string SqliteKvBackend::GetDigest() const {
  const auto path = Root() / "digest";
  if (!std::filesystem::exists(path)) {
    return {};
  }
  return ReadFileBytes(path);
}

void SqliteKvBackend::PutDigest(const std::string& digest) {
  WriteFileAtomic(Root() / "digest", digest);
}

std::string SqliteKvBackend::ComputeDigest(const std::filesystem::path& source) const {
  Sha256 hash;
  declcfg::WalkMetas(source, 1, [&](const std::filesystem::path& file, declcfg::Meta&& meta) {
    hash.Field(std::filesystem::relative(file, source).generic_string());
    hash.Field(meta.blob);
  });

  std::lock_guard lock(mutex_);
  SqliteStatement stmt(DB(), SELECT_ALL_KV);
  while (stmt.Step()) {
    hash.Field(stmt.Text(0));
    hash.Field(stmt.Blob(1));
  }
  return hash.HexDigest();
}

void SqliteKvBackend::SendBundles(const registry::BundleSender& send) const {
  std::vector<std::string> values;
  {
    std::lock_guard lock(mutex_);
    SqliteStatement stmt(DB(), SELECT_BUNDLES);
    while (stmt.Step()) {
      values.push_back(stmt.Blob(0));
    }
  }
  for (const auto& value : values) {
    registry::v1::Bundle bundle;
    if (!bundle.ParseFromString(value)) {
      throw std::runtime_error("compact cache bundle entry is corrupt");
    }
    TrimListedBundle(bundle);
    if (!send(bundle)) {
      return;
    }
  }
}

} // namespace catalog::cache
