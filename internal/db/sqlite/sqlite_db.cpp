#include "sqlite_db.hpp"

#include <stdexcept>

namespace catalog::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    auto result = Translate(db, rc);
    throw DatabaseError(Result::Err(result.code, std::string(what) + ": " + result.message));
  }
}

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, message);
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::Unsupported, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  int flags = SQLITE_OPEN_FULLMUTEX;
  switch (mode_) {
    case OpenMode::kReadWriteCreate: flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE; break;
    case OpenMode::kReadWrite: flags |= SQLITE_OPEN_READWRITE; break;
    case OpenMode::kReadOnly: flags |= SQLITE_OPEN_READONLY; break;
  }
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DatabaseError(Result::Err(result.code, "open " + path_ + ": " + result.message));
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    auto result = Translate(db_, rc);
    throw DatabaseError(Result::Err(result.code, msg));
  }
}

int64_t SqliteDB::LastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

int SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  if (mode_ == OpenMode::kReadOnly) {
    return;
  }

  // readers proceed while a loader holds the write lock; the mode is
  // persistent, so connections opened on an existing file inherit it
  if (mode_ == OpenMode::kReadWriteCreate) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // KiB
}

} // namespace catalog::db::sqlite
