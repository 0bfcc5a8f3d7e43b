#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "internal/pipeline/task_queue.hpp"

namespace aegis::core {
class Orchestrator;
struct RunReport;
}

namespace aegis::pipeline {

class EventFeed;
class PipelineStats;

/*
  Fixed pool of threads draining the task queue into the orchestrator.

  Each task's fingerprint and path are released through InFlightGuard after the
  orchestrator has written the ledger, on every exit path.
*/
class WorkerPool {
 public:
  using ReportHook = std::function<void(const model::FileTask&, const core::RunReport&)>;

  WorkerPool(std::shared_ptr<TaskQueue> queue, std::shared_ptr<core::Orchestrator> orchestrator, std::size_t threads,
             std::shared_ptr<PipelineStats> stats = nullptr, std::shared_ptr<EventFeed> events = nullptr);
  ~WorkerPool();

  // Called on the worker thread after each run.
  void SetReportHook(ReportHook hook) {
    hook_ = std::move(hook);
  }

  void Start();

  // Stops admission, drains queued tasks, joins.
  void Stop();

  std::size_t Threads() const {
    return threads_count_;
  }

 private:
  void Run(std::size_t index);
  void Publish(const model::FileTask& task, const core::RunReport& report);

  std::shared_ptr<TaskQueue>          queue_;
  std::shared_ptr<core::Orchestrator> orchestrator_;
  std::size_t                         threads_count_;
  std::shared_ptr<PipelineStats>      stats_;
  std::shared_ptr<EventFeed>          events_;
  ReportHook                          hook_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace aegis::pipeline
