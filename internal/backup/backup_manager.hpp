#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "aegis/core/v1/quarantine.pb.h"
#include "internal/model/backup_record.hpp"

namespace aegis::backup {

enum class QuarantineMode {
  kMove,  // durable copy, then remove the original
  kCopy,  // durable copy, original stays in place
};

// What went wrong, as recorded in <stem>.error.json.
struct FailureDetail {
  util::ErrorCode code = util::ErrorCode::kInternal;
  std::string     message;
  std::string     fingerprint;
  std::string     last_state;
  std::string     source;
  std::string     backup_path;
};

/*
  Backup and quarantine areas under one root:

    <root>/backups/<YYYYMMDDHHMM>/<folder>/<relative path>
    <root>/quarantine/<YYYYMMDDHHMM>/<folder>/<relative path>
    <root>/quarantine/<YYYYMMDDHHMM>/<folder>/<relative dir>/<stem>.error.json

  <folder> is the monitored root's own name. Existing destinations get a
  _001, _002 ... suffix on the stem; names are reserved with O_EXCL so
  concurrent workers never share one.
*/
class BackupManager {
 public:
  BackupManager(std::filesystem::path root, QuarantineMode mode);

  // Verbatim copy of `path`. Throws util::BackupError; `path` is never modified.
  model::BackupRecord Backup(const std::filesystem::path& path, const std::filesystem::path& monitored_root);

  // Stores `bytes`, already read from `path`, as its backup.
  model::BackupRecord Backup(const std::filesystem::path& path, const std::filesystem::path& monitored_root, const arrow::Buffer& bytes);

  /*
    Copy `path` plus its report into quarantine. The original is removed
    (kMove) only after the copy is durable. Throws util::IOError if the copy
    fails, leaving the original untouched.
  */
  model::QuarantineEntry Quarantine(const std::filesystem::path& path, const std::filesystem::path& monitored_root, const FailureDetail& detail);

  // Reports newest first; limit 0 means all.
  std::vector<aegis::core::v1::QuarantineReport> ListQuarantine(std::uint32_t limit = 0) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path BackupsDir() const {
    return root_ / "backups";
  }

  std::filesystem::path QuarantineDir() const {
    return root_ / "quarantine";
  }

  static std::filesystem::path ReportPathFor(const std::filesystem::path& quarantined_path);

 private:
  std::filesystem::path Destination(const std::filesystem::path& area, const std::filesystem::path& path,
                                    const std::filesystem::path& monitored_root, util::TimePoint now) const;

  std::filesystem::path root_;
  QuarantineMode        mode_;
};

QuarantineMode ParseQuarantineMode(const std::string& mode);

} // namespace aegis::backup
