#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace aegis::grpc {

::grpc::StatusCode StatusCodeFor(util::ErrorCode code);

// Status carrying the exception message and its classified code.
::grpc::Status ToStatus(const std::exception& e);

} // namespace aegis::grpc
