#pragma once

#include <memory>
#include <string>

#include "internal/ledger/ledger.hpp"

namespace aegis::ledger {

/*
  Opens the ledger at `sqlite_path` once at startup. Never throws:

    missing file           -> created
    unopenable / corrupt   -> renamed to <path>.corrupt-<unix ms>, fresh file
    still failing          -> MemoryLedger (degraded, logged)

  An empty `sqlite_path` or ":memory:" selects the in-memory ledger directly.
*/
inline constexpr const char* kInMemoryPath = ":memory:";

std::shared_ptr<Ledger> OpenLedger(const std::string& sqlite_path);

} // namespace aegis::ledger
