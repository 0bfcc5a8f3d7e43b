#include "internal/pipeline/task_queue.hpp"

#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"

namespace aegis::pipeline {

using observability::PathField;
using observability::StringField;

std::string_view AdmissionName(Admission admission) {
  switch (admission) {
    case Admission::kAdmitted:
      return "admitted";
    case Admission::kAlreadyProcessed:
      return "already_processed";
    case Admission::kInFlight:
      return "in_flight";
    case Admission::kDeferred:
      return "deferred";
    case Admission::kUnreadable:
      return "unreadable";
    case Admission::kRejected:
      return "rejected";
  }
  return "unknown";
}

TaskQueue::TaskQueue(std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<hash::PathHasher> hasher, TaskQueueOptions options,
                     std::shared_ptr<PipelineStats> stats, std::shared_ptr<EventFeed> events)
    : ledger_(std::move(ledger)), hasher_(std::move(hasher)), options_(options), stats_(std::move(stats)), events_(std::move(events)) {
}

void TaskQueue::Count(Admission admission, const model::FileTask& task, bool resubmitted) {
  observability::Metrics::Instance().RecordAdmission(model::SourceName(task.source), AdmissionName(admission));
  if (stats_) {
    if (!resubmitted) stats_->submitted.fetch_add(1);
    switch (admission) {
      case Admission::kAdmitted:
        stats_->admitted.fetch_add(1);
        break;
      case Admission::kAlreadyProcessed:
        stats_->already_processed.fetch_add(1);
        break;
      case Admission::kInFlight:
        stats_->in_flight_rejected.fetch_add(1);
        break;
      case Admission::kDeferred:
        stats_->deferred.fetch_add(1);
        break;
      case Admission::kUnreadable:
        stats_->unreadable.fetch_add(1);
        break;
      case Admission::kRejected:
        stats_->rejected.fetch_add(1);
        break;
    }
  }
  if (events_ && admission == Admission::kAdmitted) {
    events_->Publish("admitted", task.path.string(), model::SourceName(task.source));
  }
}

Admission TaskQueue::Submit(model::FileTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      Count(Admission::kRejected, task);
      return Admission::kRejected;
    }
  }

  if (task.fingerprint.empty()) {
    try {
      task.fingerprint = hasher_->Hash(task.path);
    } catch (const std::exception& e) {
      AEGIS_LOG_DEBUG("submit skipped unreadable file", {PathField("path", task.path), StringField("error", e.what())});
      Count(Admission::kUnreadable, task);
      return Admission::kUnreadable;
    }
  }
  if (task.enqueued_at == util::TimePoint{}) {
    task.enqueued_at = util::Now();
  }

  Admission admission = Admission::kAdmitted;
  {
    std::lock_guard lock(mutex_);
    admission = shutdown_ ? Admission::kRejected : AdmitLocked(task);
  }

  if (admission == Admission::kAdmitted) {
    cv_.notify_one();
  }
  Count(admission, task);
  return admission;
}

Admission TaskQueue::AdmitLocked(const model::FileTask& task) {
  std::optional<model::ProcessedRecord> record;
  try {
    record = ledger_->Find(task.fingerprint);
  } catch (const std::exception& e) {
    // unknown: admit
    AEGIS_LOG_WARN("ledger lookup failed", {StringField("fingerprint", task.fingerprint), StringField("error", e.what())});
  }

  const bool terminal = record && !(record->outcome == model::Outcome::kFailed && options_.retry_failed);
  if (terminal) {
    return Admission::kAlreadyProcessed;
  }
  if (in_flight_.count(task.fingerprint) > 0) {
    return Admission::kInFlight;
  }
  const auto key = task.path.string();
  if (busy_paths_.count(key) > 0) {
    deferred_.insert_or_assign(key, task);
    return Admission::kDeferred;
  }

  in_flight_.insert(task.fingerprint);
  busy_paths_.emplace(key, task.fingerprint);
  queue_.push(task);
  observability::Metrics::Instance().SetQueueDepth(queue_.size());
  observability::Metrics::Instance().SetInFlight(in_flight_.size());
  return Admission::kAdmitted;
}

std::optional<model::FileTask> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  model::FileTask task = std::move(queue_.front());
  queue_.pop();
  observability::Metrics::Instance().SetQueueDepth(queue_.size());
  return task;
}

void TaskQueue::Release(const model::FileTask& task) {
  std::optional<model::FileTask> parked;
  Admission                      admission = Admission::kRejected;
  {
    std::lock_guard lock(mutex_);
    in_flight_.erase(task.fingerprint);

    const auto key  = task.path.string();
    auto       busy = busy_paths_.find(key);
    if (busy != busy_paths_.end() && busy->second == task.fingerprint) {
      busy_paths_.erase(busy);
      auto next = deferred_.find(key);
      if (next != deferred_.end()) {
        parked = std::move(next->second);
        deferred_.erase(next);
        admission = shutdown_ ? Admission::kRejected : AdmitLocked(*parked);
      }
    }
    observability::Metrics::Instance().SetInFlight(in_flight_.size());
  }

  if (!parked) return;
  if (admission == Admission::kAdmitted) {
    cv_.notify_one();
  }
  Count(admission, *parked, true);
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::size_t TaskQueue::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

bool TaskQueue::IsInFlight(const std::string& fingerprint) const {
  std::lock_guard lock(mutex_);
  return in_flight_.count(fingerprint) > 0;
}

bool TaskQueue::IsBusy(const std::filesystem::path& path) const {
  std::lock_guard lock(mutex_);
  return busy_paths_.count(path.string()) > 0;
}

std::size_t TaskQueue::Deferred() const {
  std::lock_guard lock(mutex_);
  return deferred_.size();
}

} // namespace aegis::pipeline
