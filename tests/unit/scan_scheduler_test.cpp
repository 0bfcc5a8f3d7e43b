#include "internal/watch/scan_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/memory_ledger.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/task_queue.hpp"
#include "internal/sanitize/capability_registry.hpp"
#include "internal/watch/path_filter.hpp"
#include "tests/support/test_files.hpp"

namespace {

using aegis::model::MonitoredFolder;
using aegis::model::TaskSource;
using aegis::testing::TempDir;
using aegis::watch::ScanScheduler;

// Memory ledger that runs a hook on every lookup; the scan thread does all lookups.
class HookedLedger final : public aegis::ledger::Ledger {
 public:
  std::optional<aegis::model::ProcessedRecord> Find(const std::string& fingerprint) override {
    const int n = ++finds;
    if (on_find) on_find(n);
    return inner.Find(fingerprint);
  }
  void Record(const aegis::model::ProcessedRecord& record) override {
    inner.Record(record);
  }
  bool Clear(const std::string& fingerprint) override {
    return inner.Clear(fingerprint);
  }
  std::uint64_t ClearFailed() override {
    return inner.ClearFailed();
  }
  std::uint64_t Count() override {
    return inner.Count();
  }
  std::string Backend() const override {
    return "hooked";
  }

  std::atomic<int>         finds{0};
  std::function<void(int)> on_find;

 private:
  aegis::ledger::MemoryLedger inner;
};

struct Fixture {
  Fixture(const std::filesystem::path& base, ScanScheduler::Options options)
      : root(base / "Pictures"),
        ledger(std::make_shared<HookedLedger>()),
        hasher(std::make_shared<aegis::hash::PathHasher>()),
        queue(std::make_shared<aegis::pipeline::TaskQueue>(ledger, hasher, aegis::pipeline::TaskQueueOptions{})),
        events(std::make_shared<aegis::pipeline::EventFeed>()) {
    auto filter  = std::make_shared<aegis::watch::PathFilter>(base / "aegis-data", aegis::sanitize::CapabilityRegistry::WithBuiltins());
    auto scanner = std::make_shared<aegis::watch::FolderScanner>(filter, hasher, ledger, queue, false);
    scans        = std::make_shared<ScanScheduler>(scanner, std::vector<MonitoredFolder>{MonitoredFolder{root, true}}, options, events);
  }

  int Count(const std::string& kind, const std::string& message = {}) const {
    int n = 0;
    for (const auto& event : events->Recent()) {
      if (event.kind == kind && (message.empty() || event.message == message)) ++n;
    }
    return n;
  }

  std::filesystem::path                       root;
  std::shared_ptr<HookedLedger>               ledger;
  std::shared_ptr<aegis::hash::PathHasher>    hasher;
  std::shared_ptr<aegis::pipeline::TaskQueue> queue;
  std::shared_ptr<aegis::pipeline::EventFeed> events;
  std::shared_ptr<ScanScheduler>              scans;
};

void WriteImages(const std::filesystem::path& root, int count) {
  for (int i = 0; i < count; ++i) {
    aegis::testing::WriteFile(root / ("img" + std::to_string(i) + ".jpg"), aegis::testing::MinimalJpeg(true, "GPS=" + std::to_string(i)));
  }
}

void TestPeriodicScanFiresOnInterval() {
  TempDir dir("sched_periodic");
  Fixture f(dir.path(), ScanScheduler::Options{false, std::chrono::seconds(1)});
  WriteImages(f.root, 2);

  f.scans->Start();
  // nothing at startup
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  assert(f.Count("scan_started") == 0);

  assert(aegis::testing::WaitFor([&] { return f.Count("scan_finished") >= 2; }, std::chrono::seconds(6)));
  assert(f.Count("scan_started", "scan") >= 2);
  f.scans->Stop();

  // the second pass found the same content in flight
  assert(f.queue->Depth() == 2);
}

void TestTriggerRefusedWhileScanning() {
  TempDir dir("sched_busy");
  Fixture f(dir.path(), ScanScheduler::Options{false, std::chrono::seconds(0)});
  WriteImages(f.root, 3);

  std::mutex              gate_mutex;
  std::condition_variable gate_cv;
  bool                    open    = false;
  std::atomic<bool>       blocked = false;
  f.ledger->on_find               = [&](int) {
    std::unique_lock lock(gate_mutex);
    blocked = true;
    gate_cv.wait(lock, [&] { return open; });
  };

  f.scans->Start();
  assert(f.scans->Trigger());
  assert(aegis::testing::WaitFor([&] { return blocked.load(); }));
  assert(f.scans->Running());
  assert(!f.scans->Trigger());
  assert(!f.scans->Trigger(TaskSource::kRescan));

  {
    std::lock_guard lock(gate_mutex);
    open = true;
  }
  gate_cv.notify_all();
  f.scans->WaitIdle();
  assert(!f.scans->Running());
  assert(f.scans->LastSummary()->admitted == 3);
  assert(f.Count("scan_started") == 1);

  // idle again: the next trigger is accepted and tagged with its source
  assert(f.scans->Trigger(TaskSource::kRescan));
  f.scans->WaitIdle();
  assert(f.Count("scan_started", "rescan") == 1);
  f.scans->Stop();
}

void TestCancelStopsWalkAndAdmittedTasksDrain() {
  TempDir dir("sched_cancel");
  Fixture f(dir.path(), ScanScheduler::Options{false, std::chrono::seconds(0)});
  WriteImages(f.root, 12);

  // each new file costs the scanner one lookup and the queue one more
  std::atomic<bool> cancel_accepted = false;
  f.ledger->on_find                  = [&](int n) {
    if (n == 6) cancel_accepted = f.scans->Cancel();
  };

  f.scans->Start();
  assert(f.scans->Trigger());
  f.scans->WaitIdle();
  assert(cancel_accepted);

  const auto summary = f.scans->LastSummary();
  assert(summary.has_value());
  assert(summary->cancelled);
  assert(summary->admitted >= 1);
  assert(summary->admitted < 12);
  assert(f.Count("scan_cancelled") == 1);
  f.scans->Stop();

  // the walk stopped but everything admitted before the cancel is still queued
  f.queue->Shutdown();
  std::uint64_t drained = 0;
  while (auto task = f.queue->Dequeue()) {
    assert(task->source == TaskSource::kManual);
    ++drained;
  }
  assert(drained == summary->admitted);
}

void TestCancelWhenIdleIsRefused() {
  TempDir dir("sched_idle");
  Fixture f(dir.path(), ScanScheduler::Options{false, std::chrono::seconds(0)});
  f.scans->Start();
  assert(!f.scans->Cancel());
  assert(!f.scans->LastSummary().has_value());
  f.scans->Stop();
  assert(!f.scans->Trigger());
}

} // namespace

int main() {
  TestPeriodicScanFiresOnInterval();
  TestTriggerRefusedWhileScanning();
  TestCancelStopsWalkAndAdmittedTasksDrain();
  TestCancelWhenIdleIsRefused();

  std::cout << "aegis_unit_scan_scheduler: pass\n";
  return 0;
}
