#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace aegis::ledger {

struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/*
  Thin RAII wrapper around sqlite3*.
  Every failure throws util::LedgerError.
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

  Stmt Prepare(const std::string& sql);

  // PRAGMA quick_check == "ok"
  bool QuickCheck();

  // Configure PRAGMAs (WAL, durability, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace aegis::ledger
