#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/backup/backup_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/ledger/ledger_factory.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"
#include "internal/pipeline/task_queue.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/sanitize/capability_registry.hpp"
#include "tests/support/test_files.hpp"

namespace {

namespace fs = std::filesystem;

using aegis::pipeline::Admission;
using aegis::testing::TempDir;

std::size_t CountFiles(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  std::size_t n = 0;
  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file()) ++n;
  }
  return n;
}

aegis::model::FileTask Task(const fs::path& path, const fs::path& root) {
  aegis::model::FileTask task;
  task.path           = path;
  task.monitored_root = root;
  task.source         = aegis::model::TaskSource::kScan;
  return task;
}

/*
  Queue -> workers -> orchestrator over a sqlite ledger. A corrupt file is
  quarantined without stalling the files behind it, and nothing already
  recorded is processed twice.
*/
void TestWorkersDrainMixedBatch() {
  TempDir dir("it_batch");
  const auto root        = dir.path() / "Pictures";
  const auto backup_root = dir.path() / "aegis-data";
  aegis::testing::WriteFile(root / "good.jpg", aegis::testing::MinimalJpeg(true));
  aegis::testing::WriteFile(root / "broken.png", aegis::testing::TruncatedPng());
  aegis::testing::WriteFile(root / "later" / "good.png", aegis::testing::MinimalPng(true));
  aegis::testing::WriteFile(root / "later" / "shot.webp", aegis::testing::WebpWithExif());

  auto ledger   = aegis::ledger::OpenLedger((backup_root / "ledger.db").string());
  auto hasher   = std::make_shared<aegis::hash::PathHasher>();
  auto backups  = std::make_shared<aegis::backup::BackupManager>(backup_root, aegis::backup::QuarantineMode::kMove);
  auto registry = aegis::sanitize::CapabilityRegistry::WithBuiltins();
  auto stats    = std::make_shared<aegis::pipeline::PipelineStats>();
  auto events   = std::make_shared<aegis::pipeline::EventFeed>();

  auto orchestrator = std::make_shared<aegis::core::Orchestrator>(backups, registry, ledger, hasher, aegis::core::OrchestratorOptions{});
  auto queue        = std::make_shared<aegis::pipeline::TaskQueue>(ledger, hasher, aegis::pipeline::TaskQueueOptions{}, stats, events);
  auto workers      = std::make_shared<aegis::pipeline::WorkerPool>(queue, orchestrator, 2, stats, events);
  workers->Start();

  for (const auto* rel : {"good.jpg", "broken.png", "later/good.png", "later/shot.webp"}) {
    assert(queue->Submit(Task(root / rel, root)) == Admission::kAdmitted);
  }
  assert(aegis::testing::WaitFor([&] {
    const auto s = stats->Read();
    return s.succeeded + s.failed == 4 && queue->InFlight() == 0;
  }));

  const auto s = stats->Read();
  assert(s.succeeded == 3);
  assert(s.failed == 1);

  assert(aegis::testing::ReadFile(root / "good.jpg") == aegis::testing::MinimalJpeg(false));
  assert(!aegis::testing::Contains(aegis::testing::ReadFile(root / "later" / "good.png"), "taken at home"));
  assert(!aegis::testing::Contains(aegis::testing::ReadFile(root / "later" / "shot.webp"), "SecretCam"));
  assert(!fs::exists(root / "broken.png"));

  const auto quarantined = backups->ListQuarantine();
  assert(quarantined.size() == 1);
  assert(quarantined[0].reason_code() == "DECODE_ERROR");
  assert(aegis::testing::Contains(quarantined[0].original_path(), "broken.png"));

  const auto backups_before = CountFiles(backups->BackupsDir());
  assert(backups_before == 4);

  // cleaned outputs are known content; nothing is admitted again
  for (const auto* rel : {"good.jpg", "later/good.png", "later/shot.webp"}) {
    assert(queue->Submit(Task(root / rel, root)) == Admission::kAlreadyProcessed);
  }
  workers->Stop();
  assert(CountFiles(backups->BackupsDir()) == backups_before);

  bool saw_failed = false;
  for (const auto& event : events->Recent()) {
    if (event.kind == "failed" && aegis::testing::Contains(event.path, "broken.png")) saw_failed = true;
  }
  assert(saw_failed);
}

void TestRestartKeepsLedger() {
  TempDir dir("it_restart");
  const auto root        = dir.path() / "Pictures";
  const auto backup_root = dir.path() / "aegis-data";
  aegis::testing::WriteFile(root / "a.jpg", aegis::testing::MinimalJpeg(true));
  const auto fingerprint = aegis::hash::PathHasher().Hash(root / "a.jpg");

  {
    auto ledger  = aegis::ledger::OpenLedger((backup_root / "ledger.db").string());
    auto hasher  = std::make_shared<aegis::hash::PathHasher>();
    auto backups = std::make_shared<aegis::backup::BackupManager>(backup_root, aegis::backup::QuarantineMode::kMove);
    aegis::core::Orchestrator orchestrator(backups, aegis::sanitize::CapabilityRegistry::WithBuiltins(), ledger, hasher, {});
    auto task        = Task(root / "a.jpg", root);
    task.fingerprint = fingerprint;
    assert(orchestrator.Run(task).outcome == aegis::core::RunOutcome::kCommitted);
  }

  // a restored copy of the original is still recognised after reopening
  aegis::testing::WriteFile(root / "restored.jpg", aegis::testing::MinimalJpeg(true));
  auto ledger = aegis::ledger::OpenLedger((backup_root / "ledger.db").string());
  assert(ledger->Backend() == "sqlite");
  aegis::pipeline::TaskQueue queue(ledger, std::make_shared<aegis::hash::PathHasher>(), {});
  assert(queue.Submit(Task(root / "restored.jpg", root)) == Admission::kAlreadyProcessed);
  assert(queue.Submit(Task(root / "a.jpg", root)) == Admission::kAlreadyProcessed);
}

/*
  Whole daemon: startup scan picks up an existing file, the watcher picks up
  a new one, and the cleaned rewrites do not loop back into the pipeline.
*/
void TestApplicationScanAndWatch() {
  TempDir dir("it_app");
  const auto root        = dir.path() / "Pictures";
  const auto backup_root = dir.path() / "aegis-data";
  aegis::testing::WriteFile(root / "existing.jpg", aegis::testing::MinimalJpeg(true));

  const std::string yaml = "folders:\n"
                           "  - path: " + root.string() + "\n"
                           "watch:\n"
                           "  enabled: true\n"
                           "  debounce_ms: 100\n"
                           "scan:\n"
                           "  on_startup: true\n"
                           "workers:\n"
                           "  threads: 2\n"
                           "backup:\n"
                           "  root: " + backup_root.string() + "\n";

  auto app = aegis::factory::Build(aegis::config::ConfigLoader::LoadFromString(yaml));
  assert(!app.admin_server);
  assert(app.watchers.size() == 1);
  app.Start();

  assert(aegis::testing::WaitFor([&] { return aegis::testing::ReadFile(root / "existing.jpg") == aegis::testing::MinimalJpeg(false); }));

  aegis::testing::WriteFile(root / "new" / "fresh.png", aegis::testing::MinimalPng(true));
  assert(aegis::testing::WaitFor([&] { return aegis::testing::ReadFile(root / "new" / "fresh.png") == aegis::testing::MinimalPng(false); }));

  assert(aegis::testing::WaitFor([&] { return app.stats->Read().succeeded == 2 && app.queue->InFlight() == 0; }));
  // give the rewrite events time to pass the debouncer
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  const auto s = app.stats->Read();
  assert(s.admitted == 2);
  assert(s.succeeded == 2);
  assert(s.failed == 0);

  app.Stop();
  assert(CountFiles(backup_root / "backups") == 2);
}

} // namespace

int main() {
  TestWorkersDrainMixedBatch();
  TestRestartKeepsLedger();
  TestApplicationScanAndWatch();

  std::cout << "aegis_integration_pipeline: pass\n";
  return 0;
}
