#include "internal/ledger/ledger_factory.hpp"

#include <filesystem>
#include <system_error>

#include "internal/ledger/memory_ledger.hpp"
#include "internal/ledger/sqlite_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace aegis::ledger {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<Ledger> OpenSqlite(const std::string& path) {
  auto db = std::make_shared<SqliteDB>(path);
  if (!db->QuickCheck()) {
    throw util::LedgerError("quick_check failed for " + path);
  }
  return std::make_shared<SqliteLedger>(std::move(db));
}

void MoveAside(const std::string& path) {
  const auto suffix = ".corrupt-" + std::to_string(util::ToUnixMillis(util::Now()));
  std::error_code ec;
  fs::rename(path, path + suffix, ec);
  if (ec) {
    AEGIS_LOG_WARN("ledger move aside failed", {observability::StringField("path", path), observability::StringField("error", ec.message())});
    return;
  }
  // WAL side files belong to the corrupt database
  for (const char* side : {"-wal", "-shm"}) {
    fs::rename(path + side, path + suffix + side, ec);
  }
  AEGIS_LOG_WARN("ledger moved aside", {observability::StringField("path", path), observability::StringField("to", path + suffix)});
}

} // namespace

std::shared_ptr<Ledger> OpenLedger(const std::string& sqlite_path) {
  if (sqlite_path.empty() || sqlite_path == kInMemoryPath) {
    AEGIS_LOG_INFO("ledger opened", {observability::StringField("backend", "memory")});
    return std::make_shared<MemoryLedger>();
  }

  std::error_code ec;
  auto            parent = fs::path(sqlite_path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }

  try {
    auto ledger = OpenSqlite(sqlite_path);
    AEGIS_LOG_INFO("ledger opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite_path),
                                     observability::IntField("records", static_cast<std::int64_t>(ledger->Count()))});
    return ledger;
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("ledger unusable", {observability::StringField("path", sqlite_path), observability::StringField("error", e.what())});
  }

  if (fs::exists(sqlite_path, ec)) {
    MoveAside(sqlite_path);
  }

  try {
    auto ledger = OpenSqlite(sqlite_path);
    AEGIS_LOG_WARN("ledger recreated", {observability::StringField("path", sqlite_path)});
    return ledger;
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("ledger degraded to memory", {observability::StringField("path", sqlite_path), observability::StringField("error", e.what())});
  }

  return std::make_shared<MemoryLedger>();
}

} // namespace aegis::ledger
