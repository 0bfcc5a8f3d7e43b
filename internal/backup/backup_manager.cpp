#include "internal/backup/backup_manager.hpp"

#include <fcntl.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace aegis::backup {

namespace fs = std::filesystem;
using observability::PathField;
using observability::StringField;

namespace {

constexpr int kMaxCollisionSuffix = 999;

// Creates `path` exclusively. false when it already exists.
bool TryReserve(const fs::path& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
  if (fd >= 0) {
    ::close(fd);
    return true;
  }
  if (errno == EEXIST) {
    return false;
  }
  throw util::IOError("reserve " + path.string() + ": " + std::strerror(errno));
}

fs::path Candidate(const fs::path& dest, int attempt) {
  if (attempt == 0) {
    return dest;
  }
  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "_%03d", attempt);
  return dest.parent_path() / (dest.stem().string() + suffix + dest.extension().string());
}

void EnsureDir(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw util::IOError("create " + dir.string() + ": " + ec.message());
  }
}

void RemoveQuietly(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

// Reserves a free name for the file itself.
fs::path ReserveFile(const fs::path& dest) {
  EnsureDir(dest.parent_path());
  for (int attempt = 0; attempt <= kMaxCollisionSuffix; ++attempt) {
    auto candidate = Candidate(dest, attempt);
    if (TryReserve(candidate)) {
      return candidate;
    }
  }
  throw util::IOError("no free name for " + dest.string());
}

// Reserves a free name for the file and for its report.
fs::path ReserveWithReport(const fs::path& dest) {
  EnsureDir(dest.parent_path());
  for (int attempt = 0; attempt <= kMaxCollisionSuffix; ++attempt) {
    auto candidate = Candidate(dest, attempt);
    if (!TryReserve(candidate)) {
      continue;
    }
    if (TryReserve(BackupManager::ReportPathFor(candidate))) {
      return candidate;
    }
    RemoveQuietly(candidate);
  }
  throw util::IOError("no free name for " + dest.string());
}

} // namespace

QuarantineMode ParseQuarantineMode(const std::string& mode) {
  if (mode.empty() || mode == "move") {
    return QuarantineMode::kMove;
  }
  if (mode == "copy") {
    return QuarantineMode::kCopy;
  }
  throw util::InvalidConfig("quarantine.mode must be move or copy, got: " + mode);
}

BackupManager::BackupManager(fs::path root, QuarantineMode mode) : root_(std::move(root)), mode_(mode) {
}

fs::path BackupManager::ReportPathFor(const fs::path& quarantined_path) {
  return quarantined_path.parent_path() / (quarantined_path.stem().string() + ".error.json");
}

fs::path BackupManager::Destination(const fs::path& area, const fs::path& path, const fs::path& monitored_root, util::TimePoint now) const {
  return area / util::MinuteBucket(now) / storage::common::RootFolderName(monitored_root) / storage::common::RelativeToRoot(path, monitored_root);
}

model::BackupRecord BackupManager::Backup(const fs::path& path, const fs::path& monitored_root) {
  std::shared_ptr<arrow::Buffer> bytes;
  try {
    bytes = storage::ReadFile(path);
  } catch (const std::exception& e) {
    throw util::BackupError("backup " + path.string() + ": " + e.what());
  }
  return Backup(path, monitored_root, *bytes);
}

model::BackupRecord BackupManager::Backup(const fs::path& path, const fs::path& monitored_root, const arrow::Buffer& bytes) {
  model::BackupRecord record;
  record.original_path = path;
  record.created_at    = util::Now();

  fs::path reserved;
  try {
    reserved = ReserveFile(Destination(BackupsDir(), path, monitored_root, record.created_at));

    std::error_code          ec;
    std::optional<fs::perms> perms;
    const auto               status = fs::status(path, ec);
    if (!ec) perms = status.permissions();
    storage::AtomicWrite(reserved, bytes, perms);
  } catch (const std::exception& e) {
    if (!reserved.empty()) {
      RemoveQuietly(reserved);
    }
    throw util::BackupError("backup " + path.string() + ": " + e.what());
  }

  record.backup_path = reserved;
  AEGIS_LOG_DEBUG("backup written", {PathField("path", path), PathField("backup", reserved)});
  return record;
}

model::QuarantineEntry BackupManager::Quarantine(const fs::path& path, const fs::path& monitored_root, const FailureDetail& detail) {
  model::QuarantineEntry entry;
  entry.original_path  = path;
  entry.code           = detail.code;
  entry.detail         = detail.message;
  entry.quarantined_at = util::Now();

  const auto dest = ReserveWithReport(Destination(QuarantineDir(), path, monitored_root, entry.quarantined_at));
  entry.quarantined_path = dest;
  entry.report_path      = ReportPathFor(dest);

  try {
    storage::DurableCopy(path, dest);
  } catch (...) {
    RemoveQuietly(dest);
    RemoveQuietly(entry.report_path);
    throw;
  }

  aegis::core::v1::QuarantineReport report;
  report.set_original_path(path.string());
  report.set_quarantined_path(dest.string());
  report.set_fingerprint(detail.fingerprint);
  report.set_reason_code(std::string(util::ErrorCodeName(detail.code)));
  report.set_detail(detail.message);
  report.set_last_state(detail.last_state);
  report.set_backup_path(detail.backup_path);
  report.set_failed_at_ms(util::ToUnixMillis(entry.quarantined_at));
  report.set_failed_at(util::ToIso8601(entry.quarantined_at));
  report.set_source(detail.source);

  std::string                               json;
  google::protobuf::util::JsonPrintOptions  print_options;
  print_options.add_whitespace                = true;
  print_options.preserve_proto_field_names    = true;
  print_options.always_print_primitive_fields = true;
  auto status = google::protobuf::util::MessageToJsonString(report, &json, print_options);
  if (!status.ok()) {
    throw util::IOError("quarantine report encode: " + std::string(status.message()));
  }
  storage::AtomicWrite(entry.report_path, *arrow::Buffer::FromString(std::move(json)));

  if (mode_ == QuarantineMode::kMove) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      AEGIS_LOG_WARN("quarantine left original in place", {PathField("path", path), StringField("error", ec.message())});
    }
  }

  AEGIS_LOG_WARN("file quarantined", {PathField("path", path), PathField("quarantined", dest),
                                      StringField("reason", util::ErrorCodeName(detail.code))});
  return entry;
}

std::vector<aegis::core::v1::QuarantineReport> BackupManager::ListQuarantine(std::uint32_t limit) const {
  std::vector<aegis::core::v1::QuarantineReport> reports;

  std::error_code ec;
  if (!fs::exists(QuarantineDir(), ec)) {
    return reports;
  }

  const std::string suffix = ".error.json";
  for (fs::recursive_directory_iterator it(QuarantineDir(), fs::directory_options::skip_permission_denied, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (!it->is_regular_file(ec) || name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }

    std::ifstream      in(it->path());
    std::ostringstream text;
    text << in.rdbuf();

    aegis::core::v1::QuarantineReport        report;
    google::protobuf::util::JsonParseOptions parse_options;
    parse_options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(text.str(), &report, parse_options);
    if (!status.ok()) {
      AEGIS_LOG_WARN("unreadable quarantine report", {PathField("path", it->path()), StringField("error", std::string(status.message()))});
      continue;
    }
    reports.push_back(std::move(report));
  }

  std::sort(reports.begin(), reports.end(), [](const auto& a, const auto& b) { return a.failed_at_ms() > b.failed_at_ms(); });
  if (limit > 0 && reports.size() > limit) {
    reports.resize(limit);
  }
  return reports;
}

} // namespace aegis::backup
