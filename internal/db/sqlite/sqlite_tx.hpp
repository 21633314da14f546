#pragma once

#include "sqlite_db.hpp"

namespace catalog::db::sqlite {

/*
  Write transaction on a connection of its own.

  Opens a second connection to the database file and holds BEGIN
  IMMEDIATE on it. Concurrent units of work queue on SQLite's write lock
  (busy timeout) instead of sharing one handle, and readers on other
  connections only see committed rows. The database must be file backed.

  Rolls back on destruction unless committed.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(const SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  // connection the transaction runs on
  SqliteDB& DB() {
    return conn_;
  }

  void Commit();

 private:
  SqliteDB conn_;
  bool     committed_ = false;
};

} // namespace catalog::db::sqlite
