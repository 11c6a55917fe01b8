#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace tending::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    InvalidArgument -> INVALID_ARGUMENT
    NotFound        -> NOT_FOUND
    StorageFailure  -> UNAVAILABLE
    anything else   -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace tending::grpc
