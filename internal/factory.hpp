#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace fleetlink::runtime {
class FleetRuntime;
}

namespace fleetlink::factory {

/*
  Long-lived objects of the server process.
*/
struct Application {
  std::shared_ptr<fleetlink::runtime::FleetRuntime> runtime;
  std::vector<std::unique_ptr<::grpc::Service>>     grpc_services;
};

/*
  Composition root: the only place that knows the concrete broker client
  and credential backend.
*/
Application Build(const fleetlink::runtime::config::RuntimeConfig& config);

} // namespace fleetlink::factory
