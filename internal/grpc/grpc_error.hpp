#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace ragturn::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The error code travels as the status message prefix ("code: message").
  Insufficient balance maps to RESOURCE_EXHAUSTED with a serialized
  ragturn.v1.InsufficientBalanceDetail in error_details.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace ragturn::grpc
