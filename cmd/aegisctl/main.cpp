#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "aegis/v1.hpp"

using namespace aegis::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aegisctl <addr> stats\n"
            << "  aegisctl <addr> quarantine [limit]\n"
            << "  aegisctl <addr> scan\n"
            << "  aegisctl <addr> cancel\n"
            << "  aegisctl <addr> clear <fingerprint>\n"
            << "  aegisctl <addr> clear-failed\n"
            << "  aegisctl <addr> events [limit]\n";
}

static bool ParseLimit(int argc, char** argv, std::uint32_t& limit) {
  limit = 0;
  if (argc < 4) return true;
  try {
    limit = static_cast<std::uint32_t>(std::stoul(argv[3]));
  } catch (const std::exception&) {
    std::cerr << "invalid limit: " << argv[3] << "\n";
    return false;
  }
  return true;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AegisAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsRequest  req;
    GetStatsResponse resp;

    auto status = stub->GetStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "submitted=" << resp.submitted() << "\n"
              << "admitted=" << resp.admitted() << "\n"
              << "already_processed=" << resp.already_processed() << "\n"
              << "in_flight_rejected=" << resp.in_flight_rejected() << "\n"
              << "unreadable=" << resp.unreadable() << "\n"
              << "succeeded=" << resp.succeeded() << "\n"
              << "failed=" << resp.failed() << "\n"
              << "backup_failed=" << resp.backup_failed() << "\n"
              << "superseded=" << resp.superseded() << "\n"
              << "deferred=" << resp.deferred() << "\n"
              << "queue_depth=" << resp.queue_depth() << "\n"
              << "in_flight=" << resp.in_flight() << "\n"
              << "ledger_records=" << resp.ledger_records() << "\n"
              << "folders=" << resp.folders() << "\n"
              << "scan_running=" << (resp.scan_running() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "quarantine") {
    ListQuarantineRequest req;
    std::uint32_t         limit = 0;
    if (!ParseLimit(argc, argv, limit)) return 1;
    req.set_limit(limit);

    ListQuarantineResponse resp;

    auto status = stub->ListQuarantine(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.failed_at_ms() << " " << entry.reason_code() << " " << entry.original_path() << " -> " << entry.quarantined_path();
      if (!entry.detail().empty()) std::cout << " (" << entry.detail() << ")";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    TriggerScanRequest  req;
    TriggerScanResponse resp;

    auto status = stub->TriggerScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.started() ? "scan started" : "scan already running") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CancelScanRequest  req;
    CancelScanResponse resp;

    auto status = stub->CancelScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.cancelled() ? "scan cancelled" : "no scan running") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear" || cmd == "clear-failed") {
    ClearLedgerRequest req;
    if (cmd == "clear") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      req.set_fingerprint(argv[3]);
    } else {
      req.set_all_failed(true);
    }

    ClearLedgerResponse resp;

    auto status = stub->ClearLedger(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared=" << resp.cleared() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    RecentEventsRequest req;
    std::uint32_t       limit = 0;
    if (!ParseLimit(argc, argv, limit)) return 1;
    req.set_limit(limit);

    RecentEventsResponse resp;

    auto status = stub->RecentEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.at_ms() << " " << event.kind() << " " << event.path();
      if (!event.message().empty()) std::cout << " " << event.message();
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
