#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/registry/loader.hpp"
#include "internal/registry/query.hpp"

namespace catalog::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<const registry::Query>      query;
};

/*
  Constructs the query backend named by config and the services over it.

  This is the composition root of the application and the only place
  that knows the concrete query types.
*/
Application Build(const catalog::runtime::config::RuntimeConfig& config);

// Query backend alone; used by Build and by tests.
std::shared_ptr<const registry::Query> BuildQuery(const catalog::runtime::config::RuntimeConfig& config);

registry::LoaderOptions ToLoaderOptions(const catalog::runtime::config::SqliteSource& source);

// Loader over the configured sqlite source. Throws when the source is a cache.
std::unique_ptr<registry::SqlLoader> BuildLoader(const catalog::runtime::config::RuntimeConfig& config);

} // namespace catalog::factory
