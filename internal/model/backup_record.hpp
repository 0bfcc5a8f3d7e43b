#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace aegis::model {

// One per processing attempt; backups are never deleted by the pipeline.
struct BackupRecord {
  std::filesystem::path original_path;
  std::filesystem::path backup_path;
  util::TimePoint       created_at{};
};

struct QuarantineEntry {
  std::filesystem::path original_path;
  std::filesystem::path quarantined_path;
  std::filesystem::path report_path;
  util::ErrorCode       code = util::ErrorCode::kInternal;
  std::string           detail;
  util::TimePoint       quarantined_at{};
};

} // namespace aegis::model
