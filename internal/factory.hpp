#pragma once

#include <memory>
#include <vector>

#include "aegis/config/v1/config.pb.h"
#include "internal/model/file_task.hpp"

namespace aegis::backup {
class BackupManager;
}
namespace aegis::core {
class Orchestrator;
}
namespace aegis::hash {
class PathHasher;
}
namespace aegis::ledger {
class Ledger;
}
namespace aegis::pipeline {
class EventFeed;
class PipelineStats;
class TaskQueue;
class WorkerPool;
}
namespace aegis::runtime {
class Server;
}
namespace aegis::sanitize {
class CapabilityRegistry;
}
namespace aegis::watch {
class Debouncer;
class FolderScanner;
class InotifyWatcher;
class PathFilter;
class ScanScheduler;
}

namespace aegis::factory {

/*
  Application

  Owns every long-lived component of the daemon. Nothing runs until
  Start(); Stop() shuts the front door first, then drains the workers,
  then closes the admin plane.
*/
struct Application {
  aegis::config::v1::RuntimeConfig config;

  std::shared_ptr<ledger::Ledger>               ledger;
  std::shared_ptr<hash::PathHasher>             hasher;
  std::shared_ptr<sanitize::CapabilityRegistry> capabilities;
  std::shared_ptr<backup::BackupManager>        backups;
  std::shared_ptr<core::Orchestrator>           orchestrator;

  std::shared_ptr<pipeline::PipelineStats> stats;
  std::shared_ptr<pipeline::EventFeed>     events;
  std::shared_ptr<pipeline::TaskQueue>     queue;
  std::shared_ptr<pipeline::WorkerPool>    workers;

  std::vector<model::MonitoredFolder>               folders;
  std::shared_ptr<watch::PathFilter>                filter;
  std::shared_ptr<watch::Debouncer>                 debouncer;
  std::vector<std::unique_ptr<watch::InotifyWatcher>> watchers;
  std::shared_ptr<watch::FolderScanner>             scanner;
  std::shared_ptr<watch::ScanScheduler>             scans;

  // Null when admin.bind_address is empty.
  std::unique_ptr<runtime::Server> admin_server;

  Application();
  ~Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;

  void Start();
  void Stop();

 private:
  bool started_ = false;
};

/*
  Build full application dependency graph from a validated config.
  This is the only place that knows concrete ledger and capability types.
*/
Application Build(const aegis::config::v1::RuntimeConfig& config);

} // namespace aegis::factory
