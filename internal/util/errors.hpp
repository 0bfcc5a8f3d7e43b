#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace aegis::util {

/*
  Central error types.

  Every pipeline failure carries an ErrorCode so it can be written into the
  ledger and the quarantine report, and translated to a gRPC status.
*/

enum class ErrorCode {
  kIOError,
  kDecodeError,
  kUnsupportedFormat,
  kCapabilityError,
  kLedgerError,
  kBackupError,
  kInvalidConfig,
  kInvalidArgument,
  kInternal,
};

std::string_view ErrorCodeName(ErrorCode code);

class AegisError : public std::runtime_error {
 public:
  AegisError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

class IOError : public AegisError {
 public:
  explicit IOError(const std::string& msg) : AegisError(ErrorCode::kIOError, msg) {
  }
};

class DecodeError : public AegisError {
 public:
  explicit DecodeError(const std::string& msg) : AegisError(ErrorCode::kDecodeError, msg) {
  }
};

class UnsupportedFormat : public AegisError {
 public:
  explicit UnsupportedFormat(const std::string& msg) : AegisError(ErrorCode::kUnsupportedFormat, msg) {
  }
};

class CapabilityError : public AegisError {
 public:
  explicit CapabilityError(const std::string& msg) : AegisError(ErrorCode::kCapabilityError, msg) {
  }
};

class LedgerError : public AegisError {
 public:
  explicit LedgerError(const std::string& msg) : AegisError(ErrorCode::kLedgerError, msg) {
  }
};

class BackupError : public AegisError {
 public:
  explicit BackupError(const std::string& msg) : AegisError(ErrorCode::kBackupError, msg) {
  }
};

class InvalidConfig : public AegisError {
 public:
  explicit InvalidConfig(const std::string& msg) : AegisError(ErrorCode::kInvalidConfig, msg) {
  }
};

class InvalidArgument : public AegisError {
 public:
  explicit InvalidArgument(const std::string& msg) : AegisError(ErrorCode::kInvalidArgument, msg) {
  }
};

/*
  Maps any exception to the code recorded for it.
  Non-aegis system errors (filesystem, iostream) count as IO, the rest as internal.
*/
ErrorCode ClassifyException(const std::exception& e);

} // namespace aegis::util
