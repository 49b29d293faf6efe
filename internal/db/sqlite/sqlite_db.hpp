#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace fleetlink::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
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

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindBlob(int idx, const std::string& value);
  void BindInt64(int idx, sqlite3_int64 value);

  // true when a row is available, false when done
  bool Step();

  std::string   ColumnText(int col) const;
  std::string   ColumnBlob(int col) const;
  sqlite3_int64 ColumnInt64(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace fleetlink::db::sqlite
