#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace catalog::db::sqlite {

SqliteTransaction::SqliteTransaction(const SqliteDB& db) : conn_(db.Path(), SqliteDB::OpenMode::kReadWrite) {
  conn_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  try {
    conn_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CATALOG_LOG_WARN("sqlite rollback failed", {observability::StringField("path", conn_.Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  conn_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace catalog::db::sqlite
