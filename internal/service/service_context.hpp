#pragma once

#include <memory>

namespace fleetlink::runtime {
class FleetRuntime;
}

namespace fleetlink::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleetlink::runtime::FleetRuntime> runtime;
};

} // namespace fleetlink::service
