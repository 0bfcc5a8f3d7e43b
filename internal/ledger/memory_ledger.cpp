#include "internal/ledger/memory_ledger.hpp"

namespace aegis::ledger {

std::optional<model::ProcessedRecord> MemoryLedger::Find(const std::string& fingerprint) {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(fingerprint);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryLedger::Record(const model::ProcessedRecord& record) {
  std::lock_guard lock(mutex_);
  records_[record.fingerprint] = record;
}

bool MemoryLedger::Clear(const std::string& fingerprint) {
  std::lock_guard lock(mutex_);
  return records_.erase(fingerprint) > 0;
}

std::uint64_t MemoryLedger::ClearFailed() {
  std::lock_guard lock(mutex_);
  std::uint64_t   cleared = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.outcome == model::Outcome::kFailed) {
      it = records_.erase(it);
      ++cleared;
    } else {
      ++it;
    }
  }
  return cleared;
}

std::uint64_t MemoryLedger::Count() {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace aegis::ledger
