#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "aegis/admin/v1/admin.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace aegis::grpc {

class AdminServer final : public aegis::admin::v1::AegisAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<aegis::service::AdminService> svc);

  ::grpc::Status GetStats(::grpc::ServerContext*, const aegis::admin::v1::GetStatsRequest*, aegis::admin::v1::GetStatsResponse*) override;

  ::grpc::Status ListQuarantine(::grpc::ServerContext*, const aegis::admin::v1::ListQuarantineRequest*,
                                aegis::admin::v1::ListQuarantineResponse*) override;

  ::grpc::Status TriggerScan(::grpc::ServerContext*, const aegis::admin::v1::TriggerScanRequest*, aegis::admin::v1::TriggerScanResponse*) override;

  ::grpc::Status CancelScan(::grpc::ServerContext*, const aegis::admin::v1::CancelScanRequest*, aegis::admin::v1::CancelScanResponse*) override;

  ::grpc::Status ClearLedger(::grpc::ServerContext*, const aegis::admin::v1::ClearLedgerRequest*, aegis::admin::v1::ClearLedgerResponse*) override;

  ::grpc::Status RecentEvents(::grpc::ServerContext*, const aegis::admin::v1::RecentEventsRequest*,
                              aegis::admin::v1::RecentEventsResponse*) override;

private:
  std::shared_ptr<aegis::service::AdminService> service_;
};

}
