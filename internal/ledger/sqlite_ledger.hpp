#pragma once

#include <memory>
#include <mutex>

#include "internal/ledger/ledger.hpp"
#include "internal/ledger/sqlite_db.hpp"

namespace aegis::ledger {

/*
  Durable ledger backed by one SQLite table:

    processed(fingerprint TEXT PRIMARY KEY, outcome INTEGER,
              reason_code TEXT, reason TEXT, processed_at_ms INTEGER)

  All statements run under one mutex so writes are linearized.
*/
class SqliteLedger final : public Ledger {
 public:
  explicit SqliteLedger(std::shared_ptr<SqliteDB> db);

  std::optional<model::ProcessedRecord> Find(const std::string& fingerprint) override;
  void                                  Record(const model::ProcessedRecord& record) override;
  bool                                  Clear(const std::string& fingerprint) override;
  std::uint64_t                         ClearFailed() override;
  std::uint64_t                         Count() override;

  std::string Backend() const override {
    return "sqlite";
  }

  static const char* SchemaSql();

 private:
  void Step(sqlite3_stmt* stmt, const char* what);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace aegis::ledger
