#pragma once

#include <atomic>
#include <cstdint>

namespace aegis::pipeline {

/*
  In-process counters for the admin plane. Lock-free; any thread may bump.
*/
class PipelineStats {
 public:
  struct Snapshot {
    std::uint64_t submitted          = 0;
    std::uint64_t admitted           = 0;
    std::uint64_t already_processed  = 0;
    std::uint64_t in_flight_rejected = 0;
    std::uint64_t unreadable         = 0;
    std::uint64_t rejected           = 0;
    std::uint64_t succeeded          = 0;
    std::uint64_t failed             = 0;
    std::uint64_t backup_failed      = 0;
    std::uint64_t superseded         = 0;
    std::uint64_t deferred           = 0;
  };

  std::atomic<std::uint64_t> submitted{0};
  std::atomic<std::uint64_t> admitted{0};
  std::atomic<std::uint64_t> already_processed{0};
  std::atomic<std::uint64_t> in_flight_rejected{0};
  std::atomic<std::uint64_t> unreadable{0};
  std::atomic<std::uint64_t> rejected{0};
  std::atomic<std::uint64_t> succeeded{0};
  std::atomic<std::uint64_t> failed{0};
  std::atomic<std::uint64_t> backup_failed{0};
  std::atomic<std::uint64_t> superseded{0};
  std::atomic<std::uint64_t> deferred{0};

  Snapshot Read() const {
    Snapshot s;
    s.submitted          = submitted.load();
    s.admitted           = admitted.load();
    s.already_processed  = already_processed.load();
    s.in_flight_rejected = in_flight_rejected.load();
    s.unreadable         = unreadable.load();
    s.rejected           = rejected.load();
    s.succeeded          = succeeded.load();
    s.failed             = failed.load();
    s.backup_failed      = backup_failed.load();
    s.superseded         = superseded.load();
    s.deferred           = deferred.load();
    return s;
  }
};

} // namespace aegis::pipeline
