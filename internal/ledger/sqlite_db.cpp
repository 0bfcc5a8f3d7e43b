#include "internal/ledger/sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace aegis::ledger {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::LedgerError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::LedgerError("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
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
    throw util::LedgerError(msg);
  }
}

Stmt SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return Stmt(stmt);
}

bool SqliteDB::QuickCheck() {
  auto stmt = Prepare("PRAGMA quick_check;");
  int  rc   = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    return false;
  }
  const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
  return text && std::string(reinterpret_cast<const char*>(text)) == "ok";
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA journal_mode=WAL;");

  // a record written means the file will not be re-processed after a crash
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace aegis::ledger
