#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace cadence::db::sqlite {

/*
  Owns the connection to the bookkeeping database.

  Opening configures it for a single scheduler process that must not lose a
  committed ledger entry on crash: WAL journal, synchronous=FULL, and a busy
  timeout so a second process waits for the write lock instead of failing.

  Throws std::runtime_error when the file cannot be opened or configured.
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

  // Schema and transaction control; throws std::runtime_error.
  void Exec(const std::string& sql);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  // Throws std::runtime_error when the SQL does not prepare.
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(int index, const std::string& value);
  void Bind(int index, std::uint64_t value);

  // SQLITE_ROW, SQLITE_DONE or the failing result code.
  int Step();

  std::string   Text(int column) const;
  std::uint64_t U64(int column) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace cadence::db::sqlite
