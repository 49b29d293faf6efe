#pragma once

#include "fleetlink/v1/fleet_service.pb.h"
#include "service_context.hpp"

namespace fleetlink::service {

/*
  Dashboard-facing operations. Transport-agnostic: the gRPC adapter
  (internal/grpc/fleet_server) and tests call it directly.

  Every call counts as client activity for the session lifecycle.
*/
class FleetService {
 public:
  explicit FleetService(ServiceContext ctx);

  fleetlink::v1::ListVehiclesResponse ListVehicles(const fleetlink::v1::ListVehiclesRequest& req);
  fleetlink::v1::VehicleView          GetVehicle(const fleetlink::v1::GetVehicleRequest& req);
  fleetlink::v1::ListEventsResponse   ListEvents(const fleetlink::v1::ListEventsRequest& req);

  fleetlink::v1::MissionView          DispatchMission(const fleetlink::v1::DispatchMissionRequest& req);
  fleetlink::v1::MissionView          GetMission(const fleetlink::v1::GetMissionRequest& req);
  fleetlink::v1::ListMissionsResponse ListMissions(const fleetlink::v1::ListMissionsRequest& req);

  fleetlink::v1::SendInstantActionResponse SendInstantAction(const fleetlink::v1::SendInstantActionRequest& req);

  fleetlink::v1::HealthView                 GetHealth(const fleetlink::v1::GetHealthRequest& req);
  fleetlink::v1::HealthView                 Reconnect(const fleetlink::v1::ReconnectRequest& req);
  fleetlink::v1::UpdateBrokerConfigResponse UpdateBrokerConfig(const fleetlink::v1::UpdateBrokerConfigRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fleetlink::service
