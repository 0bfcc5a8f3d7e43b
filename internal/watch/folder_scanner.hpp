#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/file_task.hpp"

namespace aegis::hash {
class PathHasher;
}
namespace aegis::ledger {
class Ledger;
}
namespace aegis::pipeline {
class TaskQueue;
}

namespace aegis::watch {

class PathFilter;

struct ScanSummary {
  std::uint64_t visited    = 0;
  std::uint64_t candidates = 0;
  std::uint64_t known      = 0;
  std::uint64_t unreadable = 0;
  std::uint64_t submitted  = 0;
  std::uint64_t admitted   = 0;
  bool          cancelled  = false;
};

/*
  Full-tree enumerator. Hashes each accepted file, skips content the ledger
  already holds, and submits the rest with the fingerprint pre-computed.
  `cancel` is checked once per directory entry; tasks already submitted
  drain normally.
*/
class FolderScanner {
 public:
  FolderScanner(std::shared_ptr<PathFilter> filter, std::shared_ptr<hash::PathHasher> hasher, std::shared_ptr<ledger::Ledger> ledger,
                std::shared_ptr<pipeline::TaskQueue> queue, bool retry_failed);

  ScanSummary Scan(const std::vector<model::MonitoredFolder>& folders, const std::atomic<bool>& cancel, model::TaskSource source);

 private:
  bool IsKnown(const std::string& fingerprint) const;
  void ScanFolder(const model::MonitoredFolder& folder, const std::atomic<bool>& cancel, model::TaskSource source, ScanSummary& summary);

  std::shared_ptr<PathFilter>          filter_;
  std::shared_ptr<hash::PathHasher>    hasher_;
  std::shared_ptr<ledger::Ledger>      ledger_;
  std::shared_ptr<pipeline::TaskQueue> queue_;
  bool                                 retry_failed_;
};

} // namespace aegis::watch
