#include "internal/pipeline/event_feed.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace aegis::pipeline {

EventFeed::EventFeed(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

void EventFeed::Publish(std::string_view kind, std::string_view path, std::string_view message) {
  PipelineEvent event;
  event.at_ms   = util::ToUnixMillis(util::Now());
  event.kind    = std::string(kind);
  event.path    = std::string(path);
  event.message = std::string(message);

  std::lock_guard lock(mutex_);
  if (events_.size() == capacity_) {
    events_.pop_front();
  }
  events_.push_back(std::move(event));
}

std::vector<PipelineEvent> EventFeed::Recent(std::size_t limit) const {
  std::lock_guard lock(mutex_);
  const auto      count = (limit == 0 || limit > events_.size()) ? events_.size() : limit;
  return std::vector<PipelineEvent>(events_.end() - static_cast<std::ptrdiff_t>(count), events_.end());
}

} // namespace aegis::pipeline
