#pragma once

#include <cstdint>
#include <string_view>

namespace aegis::model {

/*
  Per-task sanitization state.

  Pending -> BackedUp -> MetadataCleaned -> PixelCleaned -> Committed
  Any non-terminal state may go to Failed.
*/
enum class SanitizeState : std::uint8_t {
  kPending         = 0,
  kBackedUp        = 1,
  kMetadataCleaned = 2,
  kPixelCleaned    = 3,
  kCommitted       = 4,
  kFailed          = 5,
};

constexpr bool IsTerminal(SanitizeState state) {
  return state == SanitizeState::kCommitted || state == SanitizeState::kFailed;
}

constexpr bool CanTransition(SanitizeState from, SanitizeState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SanitizeState::kFailed) {
    return true;
  }

  // forward by exactly one step
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view StateName(SanitizeState state) {
  switch (state) {
    case SanitizeState::kPending:
      return "PENDING";
    case SanitizeState::kBackedUp:
      return "BACKED_UP";
    case SanitizeState::kMetadataCleaned:
      return "METADATA_CLEANED";
    case SanitizeState::kPixelCleaned:
      return "PIXEL_CLEANED";
    case SanitizeState::kCommitted:
      return "COMMITTED";
    case SanitizeState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

} // namespace aegis::model
