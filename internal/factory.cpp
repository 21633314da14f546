#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrator.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/loader.hpp"
#include "internal/registry/querier.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"

namespace catalog::factory {

using namespace catalog;

namespace {

std::shared_ptr<const registry::Query> BuildSqliteQuery(const catalog::runtime::config::SqliteSource& source) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(source.path());
  const int applied = db::sqlite::Migrate(sqlite_db);
  CATALOG_LOG_INFO("Serving from relational store", {observability::StringField("path", source.path()),
                                                     observability::IntField("migrations_applied", applied)});
  return std::make_shared<registry::SqlQuerier>(std::move(sqlite_db));
}

std::shared_ptr<const registry::Query> BuildCacheQuery(const catalog::runtime::config::CacheSource& source) {
  std::shared_ptr<cache::Cache> cache = cache::Open(source.dir());

  if (source.rebuild_on_mismatch()) {
    cache->LoadOrRebuild(source.catalog_dir(), source.build_concurrency());
  } else {
    cache->CheckIntegrity(source.catalog_dir());
    cache->Load();
  }

  CATALOG_LOG_INFO("Serving from cache", {observability::StringField("dir", source.dir()),
                                          observability::StringField("backend", cache->GetBackend().Name()),
                                          observability::StringField("catalog_dir", source.catalog_dir())});
  return cache;
}

} // namespace

registry::LoaderOptions ToLoaderOptions(const catalog::runtime::config::SqliteSource& source) {
  registry::LoaderOptions options;
  options.enable_alpha = source.enable_alpha();
  return options;
}

std::unique_ptr<registry::SqlLoader> BuildLoader(const catalog::runtime::config::RuntimeConfig& config) {
  if (!config.has_sqlite()) {
    throw std::runtime_error("loading requires a sqlite source");
  }
  const auto& source  = config.sqlite();
  auto        options = ToLoaderOptions(source);
  CATALOG_LOG_INFO("Loading into relational store", {observability::StringField("path", source.path()),
                                                     observability::BoolField("enable_alpha", options.enable_alpha)});
  return std::make_unique<registry::SqlLoader>(std::make_shared<db::sqlite::SqliteDB>(source.path()), options);
}

std::shared_ptr<const registry::Query> BuildQuery(const catalog::runtime::config::RuntimeConfig& config) {
  if (config.has_sqlite()) {
    return BuildSqliteQuery(config.sqlite());
  }
  if (config.has_cache()) {
    return BuildCacheQuery(config.cache());
  }
  throw std::runtime_error("no query source configured");
}

/*
    Build full application dependency graph
*/
Application Build(const catalog::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Query backend
  // ------------------------------------------------------------------
  app.query = BuildQuery(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.query = app.query;

  auto registry_service = std::make_shared<service::RegistryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));

  return app;
}

} // namespace catalog::factory
