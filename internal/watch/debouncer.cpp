#include "internal/watch/debouncer.hpp"

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"

namespace aegis::watch {

Debouncer::Debouncer(std::chrono::milliseconds quiet, Callback callback) : quiet_(quiet), callback_(std::move(callback)) {
}

Debouncer::~Debouncer() {
  Stop();
}

void Debouncer::Touch(const std::filesystem::path& path, const std::filesystem::path& root) {
  {
    std::lock_guard lock(mutex_);
    pending_[path] = Entry{Clock::now() + quiet_, root};
  }
  cv_.notify_one();
}

void Debouncer::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&Debouncer::Loop, this);
}

void Debouncer::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
    pending_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t Debouncer::Pending() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void Debouncer::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (pending_.empty()) {
      cv_.wait(lock, [&] { return !running_ || !pending_.empty(); });
      continue;
    }

    auto earliest = Clock::time_point::max();
    for (const auto& [path, entry] : pending_) {
      earliest = std::min(earliest, entry.deadline);
    }

    if (Clock::now() < earliest) {
      cv_.wait_until(lock, earliest);
      continue;
    }

    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> due;
    const auto                                                           now = Clock::now();
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.deadline <= now) {
        due.emplace_back(it->first, it->second.root);
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }

    lock.unlock();
    for (const auto& [path, root] : due) {
      try {
        callback_(path, root);
      } catch (const std::exception& e) {
        AEGIS_LOG_ERROR("debounced dispatch failed", {observability::PathField("path", path), observability::StringField("error", e.what())});
      }
    }
    lock.lock();
  }
}

} // namespace aegis::watch
