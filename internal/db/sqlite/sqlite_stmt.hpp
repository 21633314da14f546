#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"

namespace catalog::db::sqlite {

/*
  Prepared statement owned for the lifetime of the object.

  Step() returns true while rows are available. Failures throw
  db::DatabaseError with the translated code.
*/
class SqliteStatement {
 public:
  SqliteStatement(const SqliteDB& db, const std::string& sql);
  SqliteStatement(const SqliteDB& db, const std::string& sql, const sql::Params& params);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  void Bind(const sql::Params& params);

  bool Step();

  // Step to completion, for statements without result rows.
  void Run();

  // Rebind for another execution.
  void Reset();

  std::string                Text(int col) const;
  std::optional<std::string> OptionalText(int col) const;
  std::string                Blob(int col) const;
  int64_t                    Int64(int col) const;
  bool                       IsNull(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// Runs a single write statement.
void Execute(const SqliteDB& db, const std::string& sql, const sql::Params& params = {});

} // namespace catalog::db::sqlite
