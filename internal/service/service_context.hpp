#pragma once

#include <cstdint>
#include <memory>

namespace aegis::backup { class BackupManager; }
namespace aegis::ledger { class Ledger; }
namespace aegis::pipeline {
class EventFeed;
class PipelineStats;
class TaskQueue;
}
namespace aegis::watch { class ScanScheduler; }

namespace aegis::service {

/*
  Dependency container for the admin service.
*/
struct ServiceContext {
  std::shared_ptr<aegis::pipeline::PipelineStats> stats;
  std::shared_ptr<aegis::pipeline::TaskQueue>     queue;
  std::shared_ptr<aegis::pipeline::EventFeed>     events;
  std::shared_ptr<aegis::ledger::Ledger>          ledger;
  std::shared_ptr<aegis::backup::BackupManager>   backups;
  std::shared_ptr<aegis::watch::ScanScheduler>    scans;
  std::uint32_t                                   folders = 0;
};

}
