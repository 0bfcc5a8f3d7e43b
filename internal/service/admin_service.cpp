#include "admin_service.hpp"

#include "internal/backup/backup_manager.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"
#include "internal/pipeline/task_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/watch/scan_scheduler.hpp"

namespace aegis::service {

using namespace aegis::admin::v1;
using observability::StringField;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetStatsResponse AdminService::GetStats(const GetStatsRequest&) {
  GetStatsResponse resp;
  if (ctx_.stats) {
    const auto s = ctx_.stats->Read();
    resp.set_submitted(s.submitted);
    resp.set_admitted(s.admitted);
    resp.set_already_processed(s.already_processed);
    resp.set_in_flight_rejected(s.in_flight_rejected);
    resp.set_unreadable(s.unreadable);
    resp.set_succeeded(s.succeeded);
    resp.set_failed(s.failed);
    resp.set_backup_failed(s.backup_failed);
    resp.set_superseded(s.superseded);
    resp.set_deferred(s.deferred);
  }
  if (ctx_.queue) {
    resp.set_queue_depth(ctx_.queue->Depth());
    resp.set_in_flight(ctx_.queue->InFlight());
  }
  if (ctx_.ledger) {
    try {
      resp.set_ledger_records(ctx_.ledger->Count());
    } catch (const std::exception& e) {
      AEGIS_LOG_WARN("ledger count failed", {StringField("error", e.what())});
    }
  }
  resp.set_folders(ctx_.folders);
  resp.set_scan_running(ctx_.scans && ctx_.scans->Running());
  return resp;
}

ListQuarantineResponse AdminService::ListQuarantine(const ListQuarantineRequest& req) {
  ListQuarantineResponse resp;
  for (auto& report : ctx_.backups->ListQuarantine(req.limit())) {
    *resp.add_entries() = std::move(report);
  }
  return resp;
}

TriggerScanResponse AdminService::TriggerScan(const TriggerScanRequest&) {
  TriggerScanResponse resp;
  resp.set_started(ctx_.scans && ctx_.scans->Trigger());
  AEGIS_LOG_INFO("admin scan trigger", {observability::BoolField("started", resp.started())});
  return resp;
}

CancelScanResponse AdminService::CancelScan(const CancelScanRequest&) {
  CancelScanResponse resp;
  resp.set_cancelled(ctx_.scans && ctx_.scans->Cancel());
  AEGIS_LOG_INFO("admin scan cancel", {observability::BoolField("cancelled", resp.cancelled())});
  return resp;
}

ClearLedgerResponse AdminService::ClearLedger(const ClearLedgerRequest& req) {
  ClearLedgerResponse resp;
  switch (req.target_case()) {
    case ClearLedgerRequest::kFingerprint:
      if (req.fingerprint().empty()) {
        throw util::InvalidArgument("fingerprint must not be empty");
      }
      resp.set_cleared(ctx_.ledger->Clear(req.fingerprint()) ? 1 : 0);
      break;
    case ClearLedgerRequest::kAllFailed:
      resp.set_cleared(req.all_failed() ? ctx_.ledger->ClearFailed() : 0);
      break;
    case ClearLedgerRequest::TARGET_NOT_SET:
      throw util::InvalidArgument("fingerprint or all_failed is required");
  }
  AEGIS_LOG_INFO("admin ledger clear", {observability::IntField("cleared", static_cast<std::int64_t>(resp.cleared()))});
  if (ctx_.events) {
    ctx_.events->Publish("ledger_cleared", "", "cleared=" + std::to_string(resp.cleared()));
  }
  return resp;
}

RecentEventsResponse AdminService::RecentEvents(const RecentEventsRequest& req) {
  RecentEventsResponse resp;
  if (!ctx_.events) {
    return resp;
  }
  for (const auto& event : ctx_.events->Recent(req.limit())) {
    auto* out = resp.add_events();
    out->set_at_ms(event.at_ms);
    out->set_kind(event.kind);
    out->set_path(event.path);
    out->set_message(event.message);
  }
  return resp;
}

} // namespace aegis::service
