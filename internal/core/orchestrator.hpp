#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/backup_record.hpp"
#include "internal/model/file_task.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/sanitize/capability.hpp"

namespace aegis::backup {
class BackupManager;
}
namespace aegis::hash {
class PathHasher;
}
namespace aegis::ledger {
class Ledger;
}
namespace aegis::sanitize {
class CapabilityRegistry;
}

namespace aegis::core {

enum class RunOutcome {
  kCommitted,
  kFailed,        // quarantined, Failed recorded
  kBackupFailed,  // nothing touched, nothing recorded
  kSuperseded,    // content changed since admission; nothing committed, nothing recorded
};

std::string_view OutcomeName(RunOutcome outcome);

struct RunReport {
  model::SanitizeState  state   = model::SanitizeState::kPending;
  RunOutcome            outcome = RunOutcome::kFailed;
  util::ErrorCode       error_code = util::ErrorCode::kInternal;
  std::string           error;
  std::string           fingerprint;
  std::string           result_fingerprint;  // set when the bytes were rewritten
  bool                  rewritten = false;
  std::string           metadata_note;
  std::string           pixel_note;

  std::optional<model::BackupRecord>    backup;
  std::optional<model::QuarantineEntry> quarantine;

  std::chrono::milliseconds duration{0};
};

struct OrchestratorOptions {
  bool                  pixel_enabled = true;
  sanitize::PixelParams pixel_params;
};

/*
  Runs one file through the sanitization state machine:

    Pending -> BackedUp -> MetadataCleaned -> PixelCleaned -> Committed
       any non-terminal state -> Failed

  The file is read once; the backup and both phases work from those bytes.
  The original is replaced only in the commit step, atomically, and only
  while it still hashes to the admitted fingerprint. Content that changed
  since admission ends the run as kSuperseded: the newer bytes stay, no
  ledger record is written, and their own event brings them back. Every
  other failure after the backup quarantines the untouched original and
  records Failed in the ledger. A backup failure touches nothing.

  Run() does not throw and does not guard against concurrent runs for the
  same content; the task queue does.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<backup::BackupManager> backups, std::shared_ptr<sanitize::CapabilityRegistry> capabilities,
               std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<hash::PathHasher> hasher, OrchestratorOptions options);

  RunReport Run(const model::FileTask& task);

  const OrchestratorOptions& Options() const {
    return options_;
  }

 private:
  void Advance(RunReport& report, model::SanitizeState next) const;
  void EnsureUnchanged(const std::filesystem::path& path, const std::string& fingerprint) const;
  void RecordOutcome(const RunReport& report, const model::FileTask& task);

  std::shared_ptr<backup::BackupManager>        backups_;
  std::shared_ptr<sanitize::CapabilityRegistry> capabilities_;
  std::shared_ptr<ledger::Ledger>               ledger_;
  std::shared_ptr<hash::PathHasher>             hasher_;
  OrchestratorOptions                           options_;
};

} // namespace aegis::core
