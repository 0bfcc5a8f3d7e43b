#include "internal/ledger/sqlite_ledger.hpp"

#include "internal/util/errors.hpp"

namespace aegis::ledger {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

const char* SqliteLedger::SchemaSql() {
  return "CREATE TABLE IF NOT EXISTS processed("
         " fingerprint     TEXT PRIMARY KEY,"
         " outcome         INTEGER NOT NULL,"
         " reason_code     TEXT NOT NULL DEFAULT '',"
         " reason          TEXT NOT NULL DEFAULT '',"
         " processed_at_ms INTEGER NOT NULL);";
}

SqliteLedger::SqliteLedger(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec(SchemaSql());
}

void SqliteLedger::Step(sqlite3_stmt* stmt, const char* what) {
  int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw util::LedgerError(std::string(what) + ": " + sqlite3_errmsg(db_->Handle()));
  }
}

std::optional<model::ProcessedRecord> SqliteLedger::Find(const std::string& fingerprint) {
  std::lock_guard lock(mutex_);
  auto stmt = db_->Prepare("SELECT outcome, reason_code, reason, processed_at_ms FROM processed WHERE fingerprint=?;");
  BindText(stmt.get(), 1, fingerprint);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw util::LedgerError(std::string("ledger find: ") + sqlite3_errmsg(db_->Handle()));
  }

  model::ProcessedRecord record;
  record.fingerprint     = fingerprint;
  record.outcome         = static_cast<model::Outcome>(sqlite3_column_int(stmt.get(), 0));
  record.reason_code     = ColText(stmt.get(), 1);
  record.reason          = ColText(stmt.get(), 2);
  record.processed_at_ms = ColU64(stmt.get(), 3);
  return record;
}

void SqliteLedger::Record(const model::ProcessedRecord& record) {
  std::lock_guard lock(mutex_);
  auto stmt = db_->Prepare(
      "INSERT INTO processed(fingerprint,outcome,reason_code,reason,processed_at_ms) VALUES(?,?,?,?,?) "
      "ON CONFLICT(fingerprint) DO UPDATE SET outcome=excluded.outcome, reason_code=excluded.reason_code, "
      "reason=excluded.reason, processed_at_ms=excluded.processed_at_ms;");
  BindText(stmt.get(), 1, record.fingerprint);
  sqlite3_bind_int(stmt.get(), 2, static_cast<int>(record.outcome));
  BindText(stmt.get(), 3, record.reason_code);
  BindText(stmt.get(), 4, record.reason);
  BindU64(stmt.get(), 5, record.processed_at_ms);
  Step(stmt.get(), "ledger record");
}

bool SqliteLedger::Clear(const std::string& fingerprint) {
  std::lock_guard lock(mutex_);
  auto            stmt = db_->Prepare("DELETE FROM processed WHERE fingerprint=?;");
  BindText(stmt.get(), 1, fingerprint);
  Step(stmt.get(), "ledger clear");
  return sqlite3_changes(db_->Handle()) > 0;
}

std::uint64_t SqliteLedger::ClearFailed() {
  std::lock_guard lock(mutex_);
  auto            stmt = db_->Prepare("DELETE FROM processed WHERE outcome=?;");
  sqlite3_bind_int(stmt.get(), 1, static_cast<int>(model::Outcome::kFailed));
  Step(stmt.get(), "ledger clear failed");
  return static_cast<std::uint64_t>(sqlite3_changes(db_->Handle()));
}

std::uint64_t SqliteLedger::Count() {
  std::lock_guard lock(mutex_);
  auto            stmt = db_->Prepare("SELECT COUNT(*) FROM processed;");
  Step(stmt.get(), "ledger count");
  return ColU64(stmt.get(), 0);
}

} // namespace aegis::ledger
