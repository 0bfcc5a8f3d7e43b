#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "internal/backup/backup_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/hash/path_hasher.hpp"
#include "internal/ledger/ledger_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"
#include "internal/pipeline/task_queue.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/runtime/server.hpp"
#include "internal/sanitize/capability_registry.hpp"
#include "internal/sanitize/command_pixel_cleaner.hpp"
#include "internal/sanitize/image_format.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/watch/debouncer.hpp"
#include "internal/watch/folder_scanner.hpp"
#include "internal/watch/inotify_watcher.hpp"
#include "internal/watch/path_filter.hpp"
#include "internal/watch/scan_scheduler.hpp"

namespace aegis::factory {

namespace fs = std::filesystem;

using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

std::shared_ptr<sanitize::CapabilityRegistry> BuildCapabilities(const aegis::config::v1::RuntimeConfig& config) {
  auto registry = sanitize::CapabilityRegistry::WithBuiltins();

  const auto& caps = config.capabilities();
  if (caps.pixel_command().empty()) {
    AEGIS_LOG_INFO("no pixel capability configured; pixel phase will be skipped");
    return registry;
  }

  std::set<sanitize::ImageFormat> formats;
  for (const auto& name : caps.pixel_formats()) {
    if (auto format = sanitize::FormatFromExtension("x." + name)) formats.insert(*format);
  }
  // No explicit list: every format that has a stripper.
  if (formats.empty()) formats = registry->EnabledFormats();

  const fs::path work_dir = fs::path(config.backup().root()) / "tmp";
  std::error_code ec;
  fs::create_directories(work_dir, ec);
  if (ec) {
    throw util::IOError("cannot create pixel work dir " + work_dir.string() + ": " + ec.message());
  }

  std::vector<std::string> argv(caps.pixel_command().begin(), caps.pixel_command().end());
  auto cleaner = std::make_shared<sanitize::CommandPixelCleaner>(std::move(argv), formats, work_dir);
  for (const auto format : formats) {
    registry->RegisterPixelCleaner(format, cleaner);
  }

  AEGIS_LOG_INFO("pixel capability registered",
                 {StringField("command", caps.pixel_command(0)), IntField("formats", static_cast<std::int64_t>(formats.size()))});
  return registry;
}

std::vector<model::MonitoredFolder> BuildFolders(const aegis::config::v1::RuntimeConfig& config) {
  std::vector<model::MonitoredFolder> folders;
  for (const auto& folder : config.folders()) {
    model::MonitoredFolder entry;
    entry.path    = fs::path(folder.path()).lexically_normal();
    entry.enabled = folder.enabled();
    folders.push_back(std::move(entry));
  }
  return folders;
}

} // namespace

Application::Application()                                  = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;

Application::~Application() {
  Stop();
}

void Application::Start() {
  if (started_) return;
  started_ = true;

  workers->Start();
  debouncer->Start();

  for (auto& watcher : watchers) {
    try {
      watcher->Start();
    } catch (const std::exception& e) {
      // The folder is still covered by scans.
      AEGIS_LOG_ERROR("watch unavailable", {PathField("folder", watcher->Folder().path), StringField("error", e.what())});
    }
  }

  scans->Start();

  if (admin_server) {
    admin_server->Start();
  }

  AEGIS_LOG_INFO("aegis-watch started", {IntField("folders", static_cast<std::int64_t>(folders.size())),
                                         IntField("watchers", static_cast<std::int64_t>(watchers.size())),
                                         IntField("workers", static_cast<std::int64_t>(workers->Threads())),
                                         StringField("ledger", ledger->Backend())});
}

void Application::Stop() {
  if (!started_) return;
  started_ = false;

  for (auto& watcher : watchers) watcher->Stop();
  if (debouncer) debouncer->Stop();
  if (scans) {
    scans->Cancel();
    scans->Stop();
  }
  // Drains tasks already admitted so none is left half-way.
  if (workers) workers->Stop();
  if (admin_server) admin_server->Stop();

  AEGIS_LOG_INFO("aegis-watch stopped");
}

Application Build(const aegis::config::v1::RuntimeConfig& config) {
  Application app;
  app.config = config;

  // ------------------------------------------------------------------
  // Storage: ledger, backup and quarantine areas
  // ------------------------------------------------------------------
  const fs::path backup_root = fs::absolute(config.backup().root()).lexically_normal();
  std::error_code ec;
  fs::create_directories(backup_root, ec);
  if (ec) {
    throw util::IOError("cannot create backup root " + backup_root.string() + ": " + ec.message());
  }

  app.ledger  = ledger::OpenLedger(config.ledger().sqlite_path());
  app.hasher  = std::make_shared<hash::PathHasher>();
  app.backups = std::make_shared<backup::BackupManager>(backup_root, backup::ParseQuarantineMode(config.quarantine().mode()));

  // ------------------------------------------------------------------
  // Sanitization
  // ------------------------------------------------------------------
  app.capabilities = BuildCapabilities(config);

  core::OrchestratorOptions options;
  options.pixel_enabled = config.pixel().enabled();
  options.pixel_params  = config::ToPixelParams(config.pixel());
  app.orchestrator = std::make_shared<core::Orchestrator>(app.backups, app.capabilities, app.ledger, app.hasher, options);

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.stats  = std::make_shared<pipeline::PipelineStats>();
  app.events = std::make_shared<pipeline::EventFeed>();

  pipeline::TaskQueueOptions queue_options;
  queue_options.retry_failed = config.ledger().retry_failed();
  app.queue   = std::make_shared<pipeline::TaskQueue>(app.ledger, app.hasher, queue_options, app.stats, app.events);
  app.workers = std::make_shared<pipeline::WorkerPool>(app.queue, app.orchestrator, config.workers().threads(), app.stats, app.events);

  // ------------------------------------------------------------------
  // Front door: scans, inotify, debounce
  // ------------------------------------------------------------------
  app.folders = BuildFolders(config);
  app.filter  = std::make_shared<watch::PathFilter>(backup_root, app.capabilities);

  app.scanner = std::make_shared<watch::FolderScanner>(app.filter, app.hasher, app.ledger, app.queue, queue_options.retry_failed);

  watch::ScanScheduler::Options scan_options;
  scan_options.on_startup = config.scan().on_startup();
  scan_options.interval   = std::chrono::seconds(config.scan().interval_sec());
  app.scans = std::make_shared<watch::ScanScheduler>(app.scanner, app.folders, scan_options, app.events);

  auto queue = app.queue;
  app.debouncer = std::make_shared<watch::Debouncer>(std::chrono::milliseconds(config.watch().debounce_ms()),
                                                     [queue](const fs::path& path, const fs::path& root) {
                                                       model::FileTask task;
                                                       task.path           = path;
                                                       task.source         = model::TaskSource::kEvent;
                                                       task.monitored_root = root;
                                                       queue->Submit(std::move(task));
                                                     });

  if (config.watch().enabled()) {
    std::weak_ptr<watch::ScanScheduler> scans = app.scans;
    std::weak_ptr<watch::Debouncer>     debouncer = app.debouncer;
    for (const auto& folder : app.folders) {
      if (!folder.enabled) continue;
      app.watchers.push_back(std::make_unique<watch::InotifyWatcher>(
          folder, app.filter,
          [debouncer](const fs::path& path, const fs::path& root) {
            if (auto d = debouncer.lock()) d->Touch(path, root);
          },
          [scans, path = folder.path]() {
            AEGIS_LOG_WARN("inotify queue overflow, rescanning", {PathField("folder", path)});
            observability::Metrics::Instance().RecordWatchOverflow();
            if (auto s = scans.lock()) s->Trigger(model::TaskSource::kRescan);
          }));
    }
  } else {
    AEGIS_LOG_INFO("file watching disabled; relying on scans");
  }

  // ------------------------------------------------------------------
  // Admin plane
  // ------------------------------------------------------------------
  if (!config.admin().bind_address().empty()) {
    service::ServiceContext ctx;
    ctx.stats   = app.stats;
    ctx.queue   = app.queue;
    ctx.events  = app.events;
    ctx.ledger  = app.ledger;
    ctx.backups = app.backups;
    ctx.scans   = app.scans;
    ctx.folders = static_cast<std::uint32_t>(app.folders.size());

    auto admin_service = std::make_shared<service::AdminService>(ctx);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
    runtime::ServerOptions server_options;
    server_options.bind_address      = config.admin().bind_address();
    server_options.shutdown_grace    = std::chrono::milliseconds(config.admin().shutdown_grace_ms());
    server_options.max_message_bytes = static_cast<int>(config.admin().max_message_mb()) * 1024 * 1024;
    app.admin_server = std::make_unique<runtime::Server>(std::move(server_options), std::move(services));
  }

  return app;
}

} // namespace aegis::factory
