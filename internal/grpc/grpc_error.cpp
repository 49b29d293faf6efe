#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace fleetlink::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fleetlink::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const MissionError*>(&e) || dynamic_cast<const ProtocolError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ConfigError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (const auto* conn = dynamic_cast<const ConnectionError*>(&e)) {
    if (conn->kind() == ConnectionError::Kind::kCancelled) {
      return {::grpc::StatusCode::CANCELLED, e.what()};
    }
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const PublishError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace fleetlink::grpc
