#include "sqlite_stmt.hpp"

namespace catalog::db::sqlite {

SqliteStatement::SqliteStatement(const SqliteDB& db, const std::string& sql) : db_(db.Handle()) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    throw DatabaseError(Result::Err(result.code, "sqlite prepare: " + result.message));
  }
}

SqliteStatement::SqliteStatement(const SqliteDB& db, const std::string& sql, const sql::Params& params) : SqliteStatement(db, sql) {
  Bind(params);
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::Bind(const sql::Params& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    int       rc    = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(params[i])) {
      rc = sqlite3_bind_null(stmt_, index);
    } else if (const auto* value = std::get_if<int64_t>(&params[i])) {
      rc = sqlite3_bind_int64(stmt_, index, *value);
    } else if (const auto* blob = std::get_if<sql::Blob>(&params[i])) {
      rc = sqlite3_bind_blob(stmt_, index, blob->bytes.data(), static_cast<int>(blob->bytes.size()), SQLITE_TRANSIENT);
    } else {
      const auto& text = std::get<std::string>(params[i]);
      rc               = sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
      auto result = Translate(db_, rc);
      throw DatabaseError(Result::Err(result.code, "sqlite bind: " + result.message));
    }
  }
}

bool SqliteStatement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw DatabaseError(Translate(db_, rc));
}

void SqliteStatement::Run() {
  while (Step()) {
  }
}

void SqliteStatement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

std::string SqliteStatement::Text(int col) const {
  const auto* text = sqlite3_column_text(stmt_, col);
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<std::string> SqliteStatement::OptionalText(int col) const {
  if (IsNull(col)) return std::nullopt;
  return Text(col);
}

std::string SqliteStatement::Blob(int col) const {
  const auto* data = sqlite3_column_blob(stmt_, col);
  if (!data) return {};
  return std::string(static_cast<const char*>(data), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t SqliteStatement::Int64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

bool SqliteStatement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

void Execute(const SqliteDB& db, const std::string& sql, const sql::Params& params) {
  SqliteStatement stmt(db, sql, params);
  stmt.Run();
}

} // namespace catalog::db::sqlite
