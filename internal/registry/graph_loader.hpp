#pragma once

#include <string>
#include <vector>

#include "internal/model/package.hpp"

namespace catalog::registry {

class SqlQuerier;

/*
  Rebuilds the in-memory replacement graph of a package from its stored
  channel entries. Read-only.
*/
class GraphLoader {
 public:
  explicit GraphLoader(const SqlQuerier& querier);

  // Fails with util::AggregateError naming every channel without a unique head.
  model::Package Generate(const std::string& package_name) const;

  // Keeps the channels that resolved; the others are reported in channel_errors.
  model::Package Generate(const std::string& package_name, std::vector<std::string>& channel_errors) const;

 private:
  const SqlQuerier& querier_;
};

} // namespace catalog::registry
