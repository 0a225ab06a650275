#pragma once

#include <exception>
#include <string>

#include <grpcpp/grpcpp.h>

namespace shopfloor::grpc {

/*
  Maps engine exceptions onto gRPC status codes.

  The status message is the exception text. error_details carries a short
  machine-readable tag ("validation.unknown_id", "graph.cycle", ...) so
  clients can branch without parsing the message.
*/
::grpc::Status ToStatus(const std::exception& e);

std::string ErrorTag(const std::exception& e);

} // namespace shopfloor::grpc
