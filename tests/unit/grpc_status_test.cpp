#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "aegis/v1.hpp"
#include "internal/backup/backup_manager.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/ledger/memory_ledger.hpp"
#include "internal/pipeline/event_feed.hpp"
#include "internal/pipeline/pipeline_stats.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_files.hpp"

namespace {

// Ledger whose storage is gone.
class BrokenLedger final : public aegis::ledger::Ledger {
 public:
  std::optional<aegis::model::ProcessedRecord> Find(const std::string&) override {
    throw aegis::util::LedgerError("database is locked");
  }
  void Record(const aegis::model::ProcessedRecord&) override {
    throw aegis::util::LedgerError("database is locked");
  }
  bool Clear(const std::string&) override {
    throw aegis::util::LedgerError("database is locked");
  }
  std::uint64_t ClearFailed() override {
    throw aegis::util::LedgerError("database is locked");
  }
  std::uint64_t Count() override {
    throw aegis::util::LedgerError("database is locked");
  }
  std::string Backend() const override {
    return "broken";
  }
};

aegis::service::ServiceContext BuildServiceContext(std::shared_ptr<aegis::ledger::Ledger> ledger, const std::filesystem::path& root) {
  aegis::service::ServiceContext ctx;
  ctx.stats   = std::make_shared<aegis::pipeline::PipelineStats>();
  ctx.events  = std::make_shared<aegis::pipeline::EventFeed>();
  ctx.ledger  = std::move(ledger);
  ctx.backups = std::make_shared<aegis::backup::BackupManager>(root, aegis::backup::QuarantineMode::kMove);
  return ctx;
}

void TestErrorMapping() {
  using aegis::grpc::ToStatus;
  assert(ToStatus(aegis::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(aegis::util::InvalidConfig("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(aegis::util::LedgerError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(aegis::util::IOError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(aegis::util::UnsupportedFormat("x")).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
  assert(ToStatus(aegis::util::DecodeError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(aegis::util::BackupError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(aegis::util::CapabilityError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::filesystem::filesystem_error("x", std::make_error_code(std::errc::io_error))).error_code() ==
         ::grpc::StatusCode::UNAVAILABLE);

  const auto status = ToStatus(aegis::util::LedgerError("database is locked"));
  assert(status.error_message() == "LEDGER_ERROR: database is locked");
}

void TestClearWithoutTargetReturnsInvalidArgument() {
  aegis::testing::TempDir dir("grpc_clear_empty");
  auto svc = std::make_shared<aegis::service::AdminService>(BuildServiceContext(std::make_shared<aegis::ledger::MemoryLedger>(), dir.path()));
  aegis::grpc::AdminServer server(svc);

  aegis::admin::v1::ClearLedgerRequest  req;
  aegis::admin::v1::ClearLedgerResponse resp;
  ::grpc::ServerContext                 grpc_ctx;
  assert(server.ClearLedger(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_fingerprint("");
  assert(server.ClearLedger(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestLedgerOutageReturnsUnavailable() {
  aegis::testing::TempDir dir("grpc_ledger_down");
  auto svc = std::make_shared<aegis::service::AdminService>(BuildServiceContext(std::make_shared<BrokenLedger>(), dir.path()));
  aegis::grpc::AdminServer server(svc);

  aegis::admin::v1::ClearLedgerRequest req;
  req.set_all_failed(true);
  aegis::admin::v1::ClearLedgerResponse resp;
  ::grpc::ServerContext                 grpc_ctx;
  assert(server.ClearLedger(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  // stats still answer; the ledger count is left at zero
  aegis::admin::v1::GetStatsRequest  stats_req;
  aegis::admin::v1::GetStatsResponse stats_resp;
  assert(server.GetStats(&grpc_ctx, &stats_req, &stats_resp).ok());
  assert(stats_resp.ledger_records() == 0);
}

void TestScanRpcsWithoutSchedulerSucceed() {
  aegis::testing::TempDir dir("grpc_no_scans");
  auto svc = std::make_shared<aegis::service::AdminService>(BuildServiceContext(std::make_shared<aegis::ledger::MemoryLedger>(), dir.path()));
  aegis::grpc::AdminServer server(svc);
  ::grpc::ServerContext    grpc_ctx;

  aegis::admin::v1::TriggerScanRequest  trigger_req;
  aegis::admin::v1::TriggerScanResponse trigger_resp;
  assert(server.TriggerScan(&grpc_ctx, &trigger_req, &trigger_resp).ok());
  assert(!trigger_resp.started());

  aegis::admin::v1::CancelScanRequest  cancel_req;
  aegis::admin::v1::CancelScanResponse cancel_resp;
  assert(server.CancelScan(&grpc_ctx, &cancel_req, &cancel_resp).ok());
  assert(!cancel_resp.cancelled());
}

void TestServerAnswersOverTheWire() {
  aegis::testing::TempDir dir("grpc_wire");
  auto ctx    = BuildServiceContext(std::make_shared<aegis::ledger::MemoryLedger>(), dir.path());
  ctx.folders = 2;
  auto svc    = std::make_shared<aegis::service::AdminService>(ctx);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<aegis::grpc::AdminServer>(svc));

  aegis::runtime::ServerOptions options;
  options.bind_address   = "127.0.0.1:0";
  options.shutdown_grace = std::chrono::milliseconds(200);
  aegis::runtime::Server server(options, std::move(services));
  server.Start();
  assert(server.Running());
  assert(server.Port() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.Port()), ::grpc::InsecureChannelCredentials());
  auto stub    = aegis::admin::v1::AegisAdminService::NewStub(channel);

  ::grpc::ClientContext              client_ctx;
  aegis::admin::v1::GetStatsRequest  req;
  aegis::admin::v1::GetStatsResponse resp;
  assert(stub->GetStats(&client_ctx, req, &resp).ok());
  assert(resp.folders() == 2);

  ::grpc::ClientContext                 clear_ctx;
  aegis::admin::v1::ClearLedgerRequest  clear_req;
  aegis::admin::v1::ClearLedgerResponse clear_resp;
  const auto status = stub->ClearLedger(&clear_ctx, clear_req, &clear_resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  server.Stop();
  assert(!server.Running());
}

void TestServerRejectsBadAddress() {
  aegis::runtime::ServerOptions options;
  options.bind_address = "256.0.0.1:1";
  aegis::runtime::Server server(options, {});
  bool threw = false;
  try {
    server.Start();
  } catch (const aegis::util::IOError&) {
    threw = true;
  }
  assert(threw);
  assert(!server.Running());
}

} // namespace

int main() {
  TestErrorMapping();
  TestClearWithoutTargetReturnsInvalidArgument();
  TestLedgerOutageReturnsUnavailable();
  TestScanRpcsWithoutSchedulerSucceed();
  TestServerAnswersOverTheWire();
  TestServerRejectsBadAddress();

  std::cout << "aegis_unit_grpc_status: pass\n";
  return 0;
}
