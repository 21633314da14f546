#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace catalog::db::sql {

// Schema version of a database no migration has touched yet.
inline constexpr int64_t kNilVersion = -1;

struct Migration {
  int64_t                  id = 0;
  std::string              name;
  std::vector<std::string> up;
};

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // kNilVersion when nothing was applied
  virtual int64_t CurrentVersion() = 0;

  virtual void RecordVersion(int64_t version) = 0;
};

/*
  Runs pending migrations in strictly increasing id order.

  Ids must be contiguous starting at 0. A recorded version newer than the
  last known migration is rejected.
  Returns the number of migrations applied.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace catalog::db::sql
