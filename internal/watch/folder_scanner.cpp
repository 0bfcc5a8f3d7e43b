#include "internal/watch/folder_scanner.hpp"

#include <filesystem>

#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/task_queue.hpp"
#include "internal/watch/path_filter.hpp"

namespace aegis::watch {

namespace fs = std::filesystem;
using observability::PathField;
using observability::StringField;

FolderScanner::FolderScanner(std::shared_ptr<PathFilter> filter, std::shared_ptr<hash::PathHasher> hasher, std::shared_ptr<ledger::Ledger> ledger,
                             std::shared_ptr<pipeline::TaskQueue> queue, bool retry_failed)
    : filter_(std::move(filter)), hasher_(std::move(hasher)), ledger_(std::move(ledger)), queue_(std::move(queue)), retry_failed_(retry_failed) {
}

bool FolderScanner::IsKnown(const std::string& fingerprint) const {
  try {
    auto record = ledger_->Find(fingerprint);
    return record && !(record->outcome == model::Outcome::kFailed && retry_failed_);
  } catch (const std::exception& e) {
    AEGIS_LOG_WARN("ledger lookup failed during scan", {StringField("fingerprint", fingerprint), StringField("error", e.what())});
    return false;
  }
}

ScanSummary FolderScanner::Scan(const std::vector<model::MonitoredFolder>& folders, const std::atomic<bool>& cancel, model::TaskSource source) {
  ScanSummary summary;
  for (const auto& folder : folders) {
    if (!folder.enabled) continue;
    if (cancel) {
      summary.cancelled = true;
      break;
    }
    ScanFolder(folder, cancel, source, summary);
    if (summary.cancelled) break;
  }
  return summary;
}

void FolderScanner::ScanFolder(const model::MonitoredFolder& folder, const std::atomic<bool>& cancel, model::TaskSource source, ScanSummary& summary) {
  std::error_code ec;
  fs::recursive_directory_iterator it(folder.path, fs::directory_options::skip_permission_denied, ec), end;
  if (ec) {
    AEGIS_LOG_WARN("scan cannot open folder", {PathField("path", folder.path), StringField("error", ec.message())});
    return;
  }

  for (; !ec && it != end; it.increment(ec)) {
    if (cancel) {
      summary.cancelled = true;
      return;
    }
    ++summary.visited;

    std::error_code type_ec;
    const auto&     path = it->path();
    if (it->is_directory(type_ec)) {
      if (filter_->IsExcludedDirectory(path)) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(type_ec) || !filter_->Accepts(path)) {
      continue;
    }
    ++summary.candidates;

    model::FileTask task;
    task.path           = path;
    task.source         = source;
    task.monitored_root = folder.path;
    try {
      task.fingerprint = hasher_->Hash(path);
    } catch (const std::exception& e) {
      ++summary.unreadable;
      AEGIS_LOG_DEBUG("scan skipped unreadable file", {PathField("path", path), StringField("error", e.what())});
      continue;
    }

    if (IsKnown(task.fingerprint)) {
      ++summary.known;
      continue;
    }

    ++summary.submitted;
    if (queue_->Submit(std::move(task)) == pipeline::Admission::kAdmitted) {
      ++summary.admitted;
    }
  }

  if (ec) {
    AEGIS_LOG_WARN("scan stopped early", {PathField("path", folder.path), StringField("error", ec.message())});
  }
}

} // namespace aegis::watch
