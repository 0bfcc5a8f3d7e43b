#include "internal/watch/scan_scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/event_feed.hpp"

namespace aegis::watch {

using observability::IntField;

ScanScheduler::ScanScheduler(std::shared_ptr<FolderScanner> scanner, std::vector<model::MonitoredFolder> folders, Options options,
                             std::shared_ptr<pipeline::EventFeed> events)
    : scanner_(std::move(scanner)), folders_(std::move(folders)), options_(options), events_(std::move(events)) {
}

ScanScheduler::~ScanScheduler() {
  Stop();
}

void ScanScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stop_            = false;
  trigger_pending_ = options_.on_startup;
  pending_source_  = model::TaskSource::kScan;
  thread_          = std::thread(&ScanScheduler::Loop, this);
}

void ScanScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cancel_ = true;
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool ScanScheduler::Trigger(model::TaskSource source) {
  {
    std::lock_guard lock(mutex_);
    if (stop_ || trigger_pending_ || scanning_) {
      return false;
    }
    trigger_pending_ = true;
    pending_source_  = source;
  }
  cv_.notify_all();
  return true;
}

bool ScanScheduler::Cancel() {
  if (!scanning_) {
    return false;
  }
  cancel_ = true;
  return true;
}

std::optional<ScanSummary> ScanScheduler::LastSummary() const {
  std::lock_guard lock(mutex_);
  return last_;
}

void ScanScheduler::WaitIdle() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return stop_ || (!trigger_pending_ && !scanning_); });
}

void ScanScheduler::Loop() {
  auto next_periodic = std::chrono::steady_clock::now() + options_.interval;

  std::unique_lock lock(mutex_);
  while (!stop_) {
    const bool periodic = options_.interval.count() > 0;
    if (!trigger_pending_) {
      if (periodic) {
        cv_.wait_until(lock, next_periodic, [&] { return stop_ || trigger_pending_; });
      } else {
        cv_.wait(lock, [&] { return stop_ || trigger_pending_; });
      }
    }
    if (stop_) break;

    model::TaskSource source = model::TaskSource::kScan;
    if (trigger_pending_) {
      trigger_pending_ = false;
      source           = pending_source_;
    } else if (!periodic || std::chrono::steady_clock::now() < next_periodic) {
      continue;
    }
    if (periodic) {
      next_periodic = std::chrono::steady_clock::now() + options_.interval;
    }

    scanning_ = true;
    cancel_   = false;
    lock.unlock();
    RunScan(source);
    lock.lock();
    scanning_ = false;
    cv_.notify_all();
  }
  scanning_ = false;
  cv_.notify_all();
}

void ScanScheduler::RunScan(model::TaskSource source) {
  AEGIS_LOG_INFO("scan started", {observability::StringField("source", model::SourceName(source))});
  if (events_) events_->Publish("scan_started", "", model::SourceName(source));

  ScanSummary summary;
  try {
    summary = scanner_->Scan(folders_, cancel_, source);
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("scan failed", {observability::StringField("error", e.what())});
  }

  AEGIS_LOG_INFO(summary.cancelled ? "scan cancelled" : "scan finished",
                 {IntField("visited", static_cast<std::int64_t>(summary.visited)), IntField("candidates", static_cast<std::int64_t>(summary.candidates)),
                  IntField("known", static_cast<std::int64_t>(summary.known)), IntField("admitted", static_cast<std::int64_t>(summary.admitted))});
  observability::Metrics::Instance().RecordScan(summary.cancelled ? "cancelled" : "finished", summary.visited, summary.admitted);
  if (events_) {
    events_->Publish(summary.cancelled ? "scan_cancelled" : "scan_finished", "",
                     "admitted=" + std::to_string(summary.admitted) + " known=" + std::to_string(summary.known));
  }

  std::lock_guard lock(mutex_);
  last_ = summary;
}

} // namespace aegis::watch
