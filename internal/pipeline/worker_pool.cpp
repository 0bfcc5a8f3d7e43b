#include "internal/pipeline/worker_pool.hpp"

#include <algorithm>

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"

namespace aegis::pipeline {

using observability::PathField;
using observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<TaskQueue> queue, std::shared_ptr<core::Orchestrator> orchestrator, std::size_t threads,
                       std::shared_ptr<PipelineStats> stats, std::shared_ptr<EventFeed> events)
    : queue_(std::move(queue)),
      orchestrator_(std::move(orchestrator)),
      threads_count_(std::max<std::size_t>(threads, 1)),
      stats_(std::move(stats)),
      events_(std::move(events)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (std::size_t i = 0; i < threads_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this, i);
  }
  AEGIS_LOG_INFO("worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(threads_count_))});
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  if (running_.exchange(false)) {
    AEGIS_LOG_INFO("worker pool stopped");
  }
}

void WorkerPool::Publish(const model::FileTask& task, const core::RunReport& report) {
  const auto outcome = core::OutcomeName(report.outcome);
  auto&      metrics = observability::Metrics::Instance();
  metrics.RecordOutcome(outcome, report.outcome == core::RunOutcome::kCommitted ? "" : util::ErrorCodeName(report.error_code));
  metrics.ObserveRunDurationMs(outcome, static_cast<double>(report.duration.count()));

  if (stats_) {
    switch (report.outcome) {
      case core::RunOutcome::kCommitted:
        stats_->succeeded.fetch_add(1);
        break;
      case core::RunOutcome::kFailed:
        stats_->failed.fetch_add(1);
        break;
      case core::RunOutcome::kBackupFailed:
        stats_->backup_failed.fetch_add(1);
        break;
      case core::RunOutcome::kSuperseded:
        stats_->superseded.fetch_add(1);
        break;
    }
  }

  if (events_) {
    events_->Publish(outcome, task.path.string(), report.error);
  }
}

void WorkerPool::Run(std::size_t index) {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    InFlightGuard guard(*queue_, *task);
    try {
      auto report = orchestrator_->Run(*task);
      Publish(*task, report);
      if (hook_) hook_(*task, report);
    } catch (const std::exception& e) {
      AEGIS_LOG_ERROR("worker task failed", {observability::IntField("worker", static_cast<std::int64_t>(index)), PathField("path", task->path),
                                             StringField("error", e.what())});
    }
  }
}

} // namespace aegis::pipeline
