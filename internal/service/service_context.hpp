#pragma once

#include <memory>

namespace catalog::registry { class Query; }

namespace catalog::service {

/*
  Dependency container shared by all services.

  The query backend is either the relational store or a loaded cache,
  chosen once at startup.
*/
struct ServiceContext {
  std::shared_ptr<const catalog::registry::Query> query;
};

}
