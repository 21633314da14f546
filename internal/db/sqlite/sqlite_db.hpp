#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace catalog::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  enum class OpenMode {
    kReadWriteCreate,
    kReadWrite, // existing file, keeps its journal mode
    kReadOnly,
  };

  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWriteCreate);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  int64_t LastInsertRowId() const;

  // rows touched by the last statement
  int Changes() const;

  // per-connection pragmas: busy timeout, WAL on create, sync level
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

// Maps a sqlite return code onto the portable result codes.
Result Translate(sqlite3* db, int rc);

} // namespace catalog::db::sqlite
