#pragma once

#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace catalog::db::sql {

/*
  Forward-only schema history of the registry database.

  Append new migrations at the end; never edit an applied one.
*/
const std::vector<Migration>& RegistryMigrations();

} // namespace catalog::db::sql
