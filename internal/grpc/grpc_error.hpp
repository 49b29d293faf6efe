#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace fleetlink::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound                         NOT_FOUND
    MissionError / ProtocolError     INVALID_ARGUMENT
    ConfigError                      FAILED_PRECONDITION
    ConnectionError / PublishError   UNAVAILABLE
    anything else                    INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace fleetlink::grpc
