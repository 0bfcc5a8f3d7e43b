#include "errors.hpp"

#include <system_error>

namespace aegis::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kIOError:
      return "IO_ERROR";
    case ErrorCode::kDecodeError:
      return "DECODE_ERROR";
    case ErrorCode::kUnsupportedFormat:
      return "UNSUPPORTED_FORMAT";
    case ErrorCode::kCapabilityError:
      return "CAPABILITY_ERROR";
    case ErrorCode::kLedgerError:
      return "LEDGER_ERROR";
    case ErrorCode::kBackupError:
      return "BACKUP_ERROR";
    case ErrorCode::kInvalidConfig:
      return "INVALID_CONFIG";
    case ErrorCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorCode::kInternal:
      return "INTERNAL";
  }
  return "INTERNAL";
}

ErrorCode ClassifyException(const std::exception& e) {
  if (const auto* aegis_error = dynamic_cast<const AegisError*>(&e)) {
    return aegis_error->code();
  }
  // filesystem_error and ios_base::failure both derive from system_error
  if (dynamic_cast<const std::system_error*>(&e)) {
    return ErrorCode::kIOError;
  }
  return ErrorCode::kInternal;
}

} // namespace aegis::util
