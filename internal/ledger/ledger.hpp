#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/processed_record.hpp"

namespace aegis::ledger {

/*
  Processed-set ledger: fingerprint -> terminal outcome.

  Implementations linearize writes; every method may be called from any
  thread. Runtime failures throw util::LedgerError.
*/
class Ledger {
 public:
  virtual ~Ledger() = default;

  virtual std::optional<model::ProcessedRecord> Find(const std::string& fingerprint) = 0;

  // Insert or overwrite the record for record.fingerprint.
  virtual void Record(const model::ProcessedRecord& record) = 0;

  virtual bool          Clear(const std::string& fingerprint) = 0;
  virtual std::uint64_t ClearFailed()                         = 0;
  virtual std::uint64_t Count()                               = 0;

  // "sqlite" or "memory"
  virtual std::string Backend() const = 0;
};

} // namespace aegis::ledger
