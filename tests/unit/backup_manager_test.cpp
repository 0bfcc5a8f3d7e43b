#include "internal/backup/backup_manager.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_files.hpp"

namespace {

namespace fs = std::filesystem;
using aegis::backup::BackupManager;
using aegis::backup::QuarantineMode;
using aegis::testing::TempDir;

aegis::backup::FailureDetail Decode(const std::string& fp) {
  aegis::backup::FailureDetail detail;
  detail.code        = aegis::util::ErrorCode::kDecodeError;
  detail.message     = "png: truncated chunk";
  detail.fingerprint = fp;
  detail.last_state  = "BACKED_UP";
  detail.source      = "event";
  return detail;
}

void TestBackupMirrorsTreeUnderRootFolderName() {
  TempDir    dir("backup_layout");
  const auto root = dir / "Pictures";
  const auto file = root / "2024/trip/beach.jpg";
  aegis::testing::WriteFile(file, "original");

  BackupManager backups(dir / "aegis", QuarantineMode::kMove);
  auto          record = backups.Backup(file, root);

  assert(aegis::testing::ReadFile(record.backup_path) == "original");
  assert(aegis::testing::ReadFile(file) == "original");
  assert(aegis::storage::common::IsUnder(record.backup_path, backups.BackupsDir()));

  // backups/<minute>/Pictures/2024/trip/beach.jpg
  const auto rel = record.backup_path.lexically_relative(backups.BackupsDir());
  auto       it  = rel.begin();
  assert(it->string().size() == 12);
  ++it;
  assert(it->string() == "Pictures");
  assert(rel.filename() == "beach.jpg");
  assert(rel.parent_path().filename() == "trip");
}

void TestRepeatedBackupsNeverOverwrite() {
  TempDir    dir("backup_collide");
  const auto root = dir / "in";
  const auto file = root / "a.png";
  aegis::testing::WriteFile(file, "v1");

  BackupManager backups(dir / "aegis", QuarantineMode::kMove);
  auto          first = backups.Backup(file, root);
  aegis::testing::WriteFile(file, "v2");
  auto second = backups.Backup(file, root);

  assert(first.backup_path != second.backup_path);
  assert(aegis::testing::ReadFile(first.backup_path) == "v1");
  assert(aegis::testing::ReadFile(second.backup_path) == "v2");
  // same minute bucket gets a numbered sibling; a new bucket keeps the plain name
  if (first.backup_path.parent_path() == second.backup_path.parent_path()) {
    assert(second.backup_path.filename() == "a_001.png");
  }
}

void TestBackupOfMissingFileThrows() {
  TempDir       dir("backup_missing");
  BackupManager backups(dir / "aegis", QuarantineMode::kMove);

  bool threw = false;
  try {
    (void)backups.Backup(dir / "in/gone.jpg", dir / "in");
  } catch (const aegis::util::BackupError&) {
    threw = true;
  }
  assert(threw);
}

void TestQuarantineMoveWritesReportAndRemovesOriginal() {
  TempDir    dir("quarantine_move");
  const auto root = dir / "in";
  const auto file = root / "sub/broken.png";
  aegis::testing::WriteFile(file, "garbage");

  BackupManager backups(dir / "aegis", QuarantineMode::kMove);
  auto          entry = backups.Quarantine(file, root, Decode("abc123"));

  assert(!fs::exists(file));
  assert(aegis::testing::ReadFile(entry.quarantined_path) == "garbage");
  assert(entry.report_path.filename() == "broken.error.json");
  assert(entry.code == aegis::util::ErrorCode::kDecodeError);

  const auto json = aegis::testing::ReadFile(entry.report_path);
  assert(aegis::testing::Contains(json, "\"reason_code\": \"DECODE_ERROR\""));
  assert(aegis::testing::Contains(json, "\"fingerprint\": \"abc123\""));
  assert(aegis::testing::Contains(json, "\"last_state\": \"BACKED_UP\""));
  assert(aegis::testing::Contains(json, "\"failed_at\": \"20"));
  assert(aegis::testing::Contains(json, "Z\""));
}

void TestQuarantineCopyKeepsOriginal() {
  TempDir    dir("quarantine_copy");
  const auto root = dir / "in";
  const auto file = root / "x.tiff";
  aegis::testing::WriteFile(file, "tiff?");

  BackupManager backups(dir / "aegis", QuarantineMode::kCopy);
  auto          entry = backups.Quarantine(file, root, Decode("fp"));

  assert(fs::exists(file));
  assert(fs::exists(entry.quarantined_path));
}

void TestListQuarantineNewestFirstWithLimit() {
  TempDir       dir("quarantine_list");
  const auto    root = dir / "in";
  BackupManager backups(dir / "aegis", QuarantineMode::kMove);

  for (int i = 0; i < 3; ++i) {
    const auto file = root / ("f" + std::to_string(i) + ".jpg");
    aegis::testing::WriteFile(file, "bad");
    (void)backups.Quarantine(file, root, Decode("fp" + std::to_string(i)));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  auto all = backups.ListQuarantine();
  assert(all.size() == 3);
  assert(all[0].failed_at_ms() >= all[1].failed_at_ms());
  assert(all[1].failed_at_ms() >= all[2].failed_at_ms());
  assert(all[0].fingerprint() == "fp2");

  assert(backups.ListQuarantine(1).size() == 1);
}

void TestParseQuarantineMode() {
  assert(aegis::backup::ParseQuarantineMode("") == QuarantineMode::kMove);
  assert(aegis::backup::ParseQuarantineMode("move") == QuarantineMode::kMove);
  assert(aegis::backup::ParseQuarantineMode("copy") == QuarantineMode::kCopy);

  bool threw = false;
  try {
    (void)aegis::backup::ParseQuarantineMode("delete");
  } catch (const aegis::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBackupMirrorsTreeUnderRootFolderName();
  TestRepeatedBackupsNeverOverwrite();
  TestBackupOfMissingFileThrows();
  TestQuarantineMoveWritesReportAndRemovesOriginal();
  TestQuarantineCopyKeepsOriginal();
  TestListQuarantineNewestFirstWithLimit();
  TestParseQuarantineMode();

  std::cout << "aegis_unit_backup_manager: pass\n";
  return 0;
}
