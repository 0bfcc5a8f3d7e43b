#include "grpc_error.hpp"

#include <string>

namespace aegis::grpc {

::grpc::StatusCode StatusCodeFor(util::ErrorCode code) {
  switch (code) {
    case util::ErrorCode::kInvalidArgument:
    case util::ErrorCode::kInvalidConfig:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case util::ErrorCode::kLedgerError:
    case util::ErrorCode::kIOError:
    case util::ErrorCode::kBackupError:
      return ::grpc::StatusCode::UNAVAILABLE;
    case util::ErrorCode::kUnsupportedFormat:
      return ::grpc::StatusCode::UNIMPLEMENTED;
    case util::ErrorCode::kCapabilityError:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case util::ErrorCode::kDecodeError:
    case util::ErrorCode::kInternal:
      break;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = util::ClassifyException(e);
  return {StatusCodeFor(code), std::string(util::ErrorCodeName(code)) + ": " + e.what()};
}

} // namespace aegis::grpc
