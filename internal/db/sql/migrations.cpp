#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

namespace catalog::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (ordered[i].id != static_cast<int64_t>(i)) {
      throw std::runtime_error("migration applied out of order: " + std::to_string(ordered[i].id) + " (" + ordered[i].name + ")");
    }
  }

  const int64_t current = executor.CurrentVersion();
  const int64_t latest  = ordered.empty() ? kNilVersion : ordered.back().id;
  if (current > latest) {
    throw std::runtime_error("database schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(latest));
  }

  int applied = 0;
  for (const auto& migration : ordered) {
    if (migration.id <= current) {
      continue;
    }
    for (const auto& statement : migration.up) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(migration.id);
    ++applied;
  }
  return applied;
}

} // namespace catalog::db::sql
