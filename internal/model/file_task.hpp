#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace aegis::model {

struct MonitoredFolder {
  std::filesystem::path path;
  bool                  enabled = true;
};

enum class TaskSource : std::uint8_t {
  kEvent,
  kScan,
  kManual,
  kRescan,  // inotify overflow
};

constexpr std::string_view SourceName(TaskSource source) {
  switch (source) {
    case TaskSource::kEvent:
      return "event";
    case TaskSource::kScan:
      return "scan";
    case TaskSource::kManual:
      return "manual";
    case TaskSource::kRescan:
      return "rescan";
  }
  return "unknown";
}

/*
  One candidate file detected by the front door.

  fingerprint stays empty until the scan or the task queue hashes the file.
  monitored_root is the folder the file was found under; backup and
  quarantine paths are laid out relative to it.
*/
struct FileTask {
  std::filesystem::path path;
  std::string           fingerprint;
  util::TimePoint       enqueued_at{};
  TaskSource            source = TaskSource::kEvent;
  std::filesystem::path monitored_root;
};

} // namespace aegis::model
