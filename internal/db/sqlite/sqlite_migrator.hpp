#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace catalog::db::sqlite {

/*
  Tracks the schema version in schema_migrations(version, timestamp).
  The table holds a single row.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db);

  void    ExecuteSQL(const std::string& sql) override;
  int64_t CurrentVersion() override;
  void    RecordVersion(int64_t version) override;

 private:
  SqliteDB& db_;
};

// Brings the registry schema up to date inside one transaction.
int Migrate(const std::shared_ptr<SqliteDB>& db);

} // namespace catalog::db::sqlite
