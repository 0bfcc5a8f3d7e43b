#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "internal/model/file_task.hpp"

namespace aegis::hash {
class PathHasher;
}
namespace aegis::ledger {
class Ledger;
}

namespace aegis::pipeline {

class EventFeed;
class PipelineStats;

enum class Admission {
  kAdmitted,
  kAlreadyProcessed,
  kInFlight,
  kDeferred,  // same path already queued or running; admitted on its Release()
  kUnreadable,
  kRejected,  // queue shut down
};

std::string_view AdmissionName(Admission admission);

struct TaskQueueOptions {
  // Re-admit content whose ledger record is Failed.
  bool retry_failed = false;
};

/*
  Admission control + FIFO for worker threads.

  Submit() hashes outside the lock, then under one admission mutex:
  ledger lookup, in-flight check and insert, push. A fingerprint stays in
  flight from admission until the worker calls Release() after the ledger
  record is written, so a concurrent duplicate sees either kInFlight or
  kAlreadyProcessed.

  A path is busy for the same span. A new version of a busy path is parked
  (latest wins) and goes through admission again when the busy task is
  released, so one path never runs on two workers.
*/
class TaskQueue {
 public:
  TaskQueue(std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<hash::PathHasher> hasher, TaskQueueOptions options,
            std::shared_ptr<PipelineStats> stats = nullptr, std::shared_ptr<EventFeed> events = nullptr);

  Admission Submit(model::FileTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<model::FileTask> Dequeue();

  void Release(const model::FileTask& task);

  // Stops admission; queued tasks still drain.
  void Shutdown();

  std::size_t Depth() const;
  std::size_t InFlight() const;
  bool        IsInFlight(const std::string& fingerprint) const;
  bool        IsBusy(const std::filesystem::path& path) const;
  std::size_t Deferred() const;

 private:
  // Caller holds mutex_.
  Admission AdmitLocked(const model::FileTask& task);
  void      Count(Admission admission, const model::FileTask& task, bool resubmitted = false);

  std::shared_ptr<ledger::Ledger>   ledger_;
  std::shared_ptr<hash::PathHasher> hasher_;
  TaskQueueOptions                  options_;
  std::shared_ptr<PipelineStats>    stats_;
  std::shared_ptr<EventFeed>        events_;

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::queue<model::FileTask>     queue_;
  std::unordered_set<std::string> in_flight_;
  // path -> fingerprint of its queued or running task
  std::unordered_map<std::string, std::string>     busy_paths_;
  std::unordered_map<std::string, model::FileTask> deferred_;
  bool                                             shutdown_ = false;
};

/*
  Releases an admitted task's fingerprint and path on scope exit.
*/
class InFlightGuard {
 public:
  InFlightGuard(TaskQueue& queue, model::FileTask task) : queue_(queue), task_(std::move(task)) {
  }
  ~InFlightGuard() {
    queue_.Release(task_);
  }

  InFlightGuard(const InFlightGuard&)            = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  TaskQueue&      queue_;
  model::FileTask task_;
};

} // namespace aegis::pipeline
