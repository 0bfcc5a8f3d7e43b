#pragma once

#include "aegis/admin/v1/admin.pb.h"
#include "service_context.hpp"

namespace aegis::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  aegis::admin::v1::GetStatsResponse       GetStats(const aegis::admin::v1::GetStatsRequest& req);
  aegis::admin::v1::ListQuarantineResponse ListQuarantine(const aegis::admin::v1::ListQuarantineRequest& req);
  aegis::admin::v1::TriggerScanResponse    TriggerScan(const aegis::admin::v1::TriggerScanRequest& req);
  aegis::admin::v1::CancelScanResponse     CancelScan(const aegis::admin::v1::CancelScanRequest& req);
  aegis::admin::v1::ClearLedgerResponse    ClearLedger(const aegis::admin::v1::ClearLedgerRequest& req);
  aegis::admin::v1::RecentEventsResponse   RecentEvents(const aegis::admin::v1::RecentEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
