#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace aegis::pipeline {

struct PipelineEvent {
  std::uint64_t at_ms = 0;
  std::string   kind;  // admitted, committed, failed, backup_failed, superseded, scan_started, scan_finished ...
  std::string   path;
  std::string   message;
};

/*
  Bounded ring of recent pipeline events. When full the oldest entry is
  dropped; Publish never waits on readers beyond the short copy lock.
*/
class EventFeed {
 public:
  explicit EventFeed(std::size_t capacity = 512);

  void Publish(std::string_view kind, std::string_view path, std::string_view message = {});

  // Up to `limit` newest events, oldest first. limit 0 means all.
  std::vector<PipelineEvent> Recent(std::size_t limit = 0) const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t         capacity_;
  mutable std::mutex        mutex_;
  std::deque<PipelineEvent> events_;
};

} // namespace aegis::pipeline
