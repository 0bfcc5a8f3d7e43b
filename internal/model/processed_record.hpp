#pragma once

#include <cstdint>
#include <string>

namespace aegis::model {

enum class Outcome : std::uint8_t {
  kSuccess = 1,
  kFailed  = 2,
};

/*
  Ledger row: one per unique file content ever processed.
  reason_code/reason are only set for kFailed.
*/
struct ProcessedRecord {
  std::string fingerprint;
  Outcome     outcome = Outcome::kSuccess;
  std::string reason_code;
  std::string reason;
  uint64_t    processed_at_ms = 0;
};

} // namespace aegis::model
