#include "internal/core/orchestrator.hpp"

#include "internal/backup/backup_manager.hpp"
#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sanitize/capability_registry.hpp"
#include "internal/sanitize/image_format.hpp"
#include "internal/storage/atomic_file.hpp"

namespace aegis::core {

using model::SanitizeState;
using observability::PathField;
using observability::StringField;

namespace {

// The file no longer holds the admitted content.
class ContentChanged : public util::IOError {
 public:
  using util::IOError::IOError;
};

} // namespace

std::string_view OutcomeName(RunOutcome outcome) {
  switch (outcome) {
    case RunOutcome::kCommitted:
      return "committed";
    case RunOutcome::kFailed:
      return "failed";
    case RunOutcome::kBackupFailed:
      return "backup_failed";
    case RunOutcome::kSuperseded:
      return "superseded";
  }
  return "unknown";
}

Orchestrator::Orchestrator(std::shared_ptr<backup::BackupManager> backups, std::shared_ptr<sanitize::CapabilityRegistry> capabilities,
                           std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<hash::PathHasher> hasher, OrchestratorOptions options)
    : backups_(std::move(backups)),
      capabilities_(std::move(capabilities)),
      ledger_(std::move(ledger)),
      hasher_(std::move(hasher)),
      options_(std::move(options)) {
}

void Orchestrator::Advance(RunReport& report, SanitizeState next) const {
  if (!model::CanTransition(report.state, next)) {
    throw util::AegisError(util::ErrorCode::kInternal,
                           "illegal transition " + std::string(model::StateName(report.state)) + " -> " + std::string(model::StateName(next)));
  }
  report.state = next;
}

void Orchestrator::EnsureUnchanged(const std::filesystem::path& path, const std::string& fingerprint) const {
  std::string current;
  try {
    current = hasher_->Hash(path);
  } catch (const std::exception& e) {
    throw ContentChanged(path.string() + " vanished: " + e.what());
  }
  if (current != fingerprint) {
    throw ContentChanged(path.string() + " changed since admission");
  }
}

RunReport Orchestrator::Run(const model::FileTask& task) {
  const auto started = std::chrono::steady_clock::now();
  const auto path    = task.path.string();

  RunReport report;
  report.fingerprint = task.fingerprint;

  auto finish = [&]() -> RunReport {
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return report;
  };

  auto superseded = [&](const ContentChanged& e) -> RunReport {
    report.state      = SanitizeState::kFailed;
    report.outcome    = RunOutcome::kSuperseded;
    report.error_code = util::ErrorCode::kIOError;
    report.error      = e.what();
    AEGIS_LOG_WARN("content changed under run, left as is", {StringField("path", path), StringField("error", report.error)});
    return finish();
  };

  // Pending -> BackedUp
  std::shared_ptr<arrow::Buffer> original;
  try {
    original            = storage::ReadFile(task.path);
    const auto admitted = hasher_->HashBuffer(*original);
    if (!report.fingerprint.empty() && admitted != report.fingerprint) {
      throw ContentChanged(path + " changed since admission");
    }
    report.fingerprint = admitted;

    report.backup = backups_->Backup(task.path, task.monitored_root, *original);
    Advance(report, SanitizeState::kBackedUp);
  } catch (const ContentChanged& e) {
    return superseded(e);
  } catch (const std::exception& e) {
    report.state      = SanitizeState::kFailed;
    report.outcome    = RunOutcome::kBackupFailed;
    report.error_code = util::ClassifyException(e);
    report.error      = e.what();
    AEGIS_LOG_ERROR("backup failed, file left untouched", {StringField("path", path), StringField("error", report.error)});
    return finish();
  }

  SanitizeState last_good = report.state;
  try {
    auto format = sanitize::FormatFromExtension(task.path);
    if (!format) {
      throw util::UnsupportedFormat("unsupported extension: " + task.path.extension().string());
    }

    // BackedUp -> MetadataCleaned
    auto stripper = capabilities_->StripperFor(*format);
    if (!stripper) {
      throw util::UnsupportedFormat("no metadata capability for " + std::string(sanitize::FormatName(*format)));
    }
    auto working = original;
    auto meta    = stripper->Strip(*working, *format);
    if (meta.failed()) {
      throw util::AegisError(meta.error, meta.reason);
    }
    if (meta.applied()) {
      working = meta.bytes;
    }
    report.metadata_note = meta.applied() ? "applied" : "skipped: " + meta.reason;
    Advance(report, SanitizeState::kMetadataCleaned);
    last_good = report.state;

    // MetadataCleaned -> PixelCleaned
    auto cleaner = options_.pixel_enabled ? capabilities_->PixelCleanerFor(*format) : nullptr;
    if (!cleaner) {
      report.pixel_note = options_.pixel_enabled ? "skipped: no pixel capability" : "skipped: disabled";
    } else {
      auto pixel = cleaner->Clean(*working, *format, options_.pixel_params);
      if (pixel.failed()) {
        throw util::AegisError(pixel.error, pixel.reason);
      }
      if (pixel.applied()) {
        working = pixel.bytes;
      }
      report.pixel_note = pixel.applied() ? "applied" : "skipped: " + pixel.reason;
    }
    Advance(report, SanitizeState::kPixelCleaned);
    last_good = report.state;

    // PixelCleaned -> Committed
    if (!working->Equals(*original)) {
      // a write since the read wins over our cleaned copy of the older bytes
      EnsureUnchanged(task.path, report.fingerprint);
      storage::AtomicWrite(task.path, *working);
      report.rewritten          = true;
      report.result_fingerprint = hasher_->HashBuffer(*working);
    }
    Advance(report, SanitizeState::kCommitted);
    report.outcome = RunOutcome::kCommitted;
  } catch (const ContentChanged& e) {
    return superseded(e);
  } catch (const std::exception& e) {
    if (report.rewritten) {
      // the cleaned bytes are in place; only an untouched original is ever quarantined
      AEGIS_LOG_WARN("step after commit failed", {StringField("path", path), StringField("error", e.what())});
      report.state   = SanitizeState::kCommitted;
      report.outcome = RunOutcome::kCommitted;
      RecordOutcome(report, task);
      return finish();
    }
    report.state      = SanitizeState::kFailed;
    report.outcome    = RunOutcome::kFailed;
    report.error_code = util::ClassifyException(e);
    report.error      = e.what();

    backup::FailureDetail detail;
    detail.code        = report.error_code;
    detail.message     = report.error;
    detail.fingerprint = report.fingerprint;
    detail.last_state  = std::string(model::StateName(last_good));
    detail.source      = std::string(model::SourceName(task.source));
    detail.backup_path = report.backup->backup_path.string();

    try {
      report.quarantine = backups_->Quarantine(task.path, task.monitored_root, detail);
    } catch (const std::exception& qe) {
      AEGIS_LOG_ERROR("quarantine failed", {StringField("path", path), StringField("error", qe.what())});
    }

    AEGIS_LOG_ERROR("sanitize failed", {StringField("path", path), StringField("reason", util::ErrorCodeName(report.error_code)),
                                        StringField("error", report.error), StringField("last_state", detail.last_state)});
  }

  RecordOutcome(report, task);

  if (report.outcome == RunOutcome::kCommitted) {
    AEGIS_LOG_INFO("sanitized", {StringField("path", path), StringField("metadata", report.metadata_note), StringField("pixel", report.pixel_note),
                                 observability::BoolField("rewritten", report.rewritten)});
  }
  return finish();
}

void Orchestrator::RecordOutcome(const RunReport& report, const model::FileTask& task) {
  if (report.fingerprint.empty()) {
    return;
  }

  const auto now = util::ToUnixMillis(util::Now());
  try {
    model::ProcessedRecord record;
    record.fingerprint     = report.fingerprint;
    record.processed_at_ms = now;
    if (report.outcome == RunOutcome::kCommitted) {
      record.outcome = model::Outcome::kSuccess;
    } else {
      record.outcome     = model::Outcome::kFailed;
      record.reason_code = std::string(util::ErrorCodeName(report.error_code));
      record.reason      = report.error;
    }
    ledger_->Record(record);

    // the cleaned output must not be admitted again by our own modify event
    if (report.rewritten && !report.result_fingerprint.empty() && report.result_fingerprint != report.fingerprint) {
      model::ProcessedRecord post;
      post.fingerprint     = report.result_fingerprint;
      post.outcome         = model::Outcome::kSuccess;
      post.processed_at_ms = now;
      ledger_->Record(post);
    }
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("ledger write failed", {PathField("path", task.path), StringField("fingerprint", report.fingerprint),
                                            StringField("error", e.what())});
  }
}

} // namespace aegis::core
