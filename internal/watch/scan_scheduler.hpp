#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "internal/watch/folder_scanner.hpp"

namespace aegis::pipeline {
class EventFeed;
}

namespace aegis::watch {

/*
  Runs full scans on one background thread: once at startup (optional),
  every `interval` (zero disables), and on Trigger(). At most one scan runs
  at a time; Trigger() during a scan is refused. Cancel() stops the walk at
  the next directory entry.
*/
class ScanScheduler {
 public:
  struct Options {
    bool                 on_startup = true;
    std::chrono::seconds interval{0};
  };

  ScanScheduler(std::shared_ptr<FolderScanner> scanner, std::vector<model::MonitoredFolder> folders, Options options,
                std::shared_ptr<pipeline::EventFeed> events = nullptr);
  ~ScanScheduler();

  void Start();
  void Stop();

  // false when a scan is already running or pending
  bool Trigger(model::TaskSource source = model::TaskSource::kManual);

  // false when no scan is running
  bool Cancel();

  bool Running() const {
    return scanning_;
  }

  std::optional<ScanSummary> LastSummary() const;

  // Blocks until no scan is running or pending (tests, shutdown).
  void WaitIdle();

 private:
  void Loop();
  void RunScan(model::TaskSource source);

  std::shared_ptr<FolderScanner>       scanner_;
  std::vector<model::MonitoredFolder>  folders_;
  Options                              options_;
  std::shared_ptr<pipeline::EventFeed> events_;

  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  bool                       trigger_pending_ = false;
  model::TaskSource          pending_source_  = model::TaskSource::kScan;
  bool                       stop_            = false;
  std::optional<ScanSummary> last_;

  std::atomic<bool> scanning_{false};
  std::atomic<bool> cancel_{false};
  std::thread       thread_;
};

} // namespace aegis::watch
