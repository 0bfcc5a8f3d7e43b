#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace aegis::grpc {

using namespace aegis::admin::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(const char* route, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<aegis::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  return Invoke("AdminService.GetStats", [&] { *resp = service_->GetStats(*req); });
}

::grpc::Status AdminServer::ListQuarantine(::grpc::ServerContext*, const ListQuarantineRequest* req, ListQuarantineResponse* resp) {
  return Invoke("AdminService.ListQuarantine", [&] { *resp = service_->ListQuarantine(*req); });
}

::grpc::Status AdminServer::TriggerScan(::grpc::ServerContext*, const TriggerScanRequest* req, TriggerScanResponse* resp) {
  return Invoke("AdminService.TriggerScan", [&] { *resp = service_->TriggerScan(*req); });
}

::grpc::Status AdminServer::CancelScan(::grpc::ServerContext*, const CancelScanRequest* req, CancelScanResponse* resp) {
  return Invoke("AdminService.CancelScan", [&] { *resp = service_->CancelScan(*req); });
}

::grpc::Status AdminServer::ClearLedger(::grpc::ServerContext*, const ClearLedgerRequest* req, ClearLedgerResponse* resp) {
  return Invoke("AdminService.ClearLedger", [&] { *resp = service_->ClearLedger(*req); });
}

::grpc::Status AdminServer::RecentEvents(::grpc::ServerContext*, const RecentEventsRequest* req, RecentEventsResponse* resp) {
  return Invoke("AdminService.RecentEvents", [&] { *resp = service_->RecentEvents(*req); });
}

} // namespace aegis::grpc
