#include "sqlite_migrator.hpp"

#include "internal/db/sql/registry_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_stmt.hpp"
#include "sqlite_tx.hpp"

namespace catalog::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  db_.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER NOT NULL, timestamp INTEGER);");
}

void SqliteMigrationExecutor::ExecuteSQL(const std::string& sql) {
  db_.Exec(sql);
}

int64_t SqliteMigrationExecutor::CurrentVersion() {
  SqliteStatement stmt(db_, "SELECT version FROM schema_migrations ORDER BY version DESC LIMIT 1;");
  if (!stmt.Step()) {
    return sql::kNilVersion;
  }
  return stmt.Int64(0);
}

void SqliteMigrationExecutor::RecordVersion(int64_t version) {
  Execute(db_, "DELETE FROM schema_migrations;");
  Execute(db_, "INSERT INTO schema_migrations(version, timestamp) VALUES(?, ?);",
          {version, static_cast<int64_t>(util::ToUnixMillis(util::Now()))});
}

int Migrate(const std::shared_ptr<SqliteDB>& db) {
  SqliteTransaction       tx(*db);
  SqliteMigrationExecutor executor(tx.DB());

  const int applied = sql::RunMigrations(executor, sql::RegistryMigrations());
  tx.Commit();

  if (applied > 0) {
    CATALOG_LOG_INFO("applied schema migrations",
                     {observability::StringField("path", db->Path()), observability::IntField("count", applied),
                      observability::IntField("version", sql::RegistryMigrations().back().id)});
  }
  return applied;
}

} // namespace catalog::db::sqlite
