#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/ledger/ledger.hpp"

namespace aegis::ledger {

/*
  Process-lifetime ledger. Used by tests and as the degraded fallback when no
  durable ledger can be opened.
*/
class MemoryLedger final : public Ledger {
 public:
  std::optional<model::ProcessedRecord> Find(const std::string& fingerprint) override;
  void                                  Record(const model::ProcessedRecord& record) override;
  bool                                  Clear(const std::string& fingerprint) override;
  std::uint64_t                         ClearFailed() override;
  std::uint64_t                         Count() override;

  std::string Backend() const override {
    return "memory";
  }

 private:
  std::mutex                                              mutex_;
  std::unordered_map<std::string, model::ProcessedRecord> records_;
};

} // namespace aegis::ledger
