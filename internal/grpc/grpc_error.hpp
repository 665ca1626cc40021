#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace threadnet::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  InvalidFormat      -> INVALID_ARGUMENT
  NotFound           -> NOT_FOUND
  NotAllowed         -> FAILED_PRECONDITION
  InvalidState       -> FAILED_PRECONDITION
  ResourceExhausted  -> RESOURCE_EXHAUSTED
  anything else      -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace threadnet::grpc
