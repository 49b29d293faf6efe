#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fleetlink/v1/fleet_service.grpc.pb.h"
#include "internal/service/fleet_service.hpp"

namespace fleetlink::grpc {

class FleetServer final : public fleetlink::v1::FleetService::Service {
 public:
  explicit FleetServer(std::shared_ptr<fleetlink::service::FleetService> svc);

  ::grpc::Status ListVehicles(::grpc::ServerContext*, const fleetlink::v1::ListVehiclesRequest*, fleetlink::v1::ListVehiclesResponse*) override;
  ::grpc::Status GetVehicle(::grpc::ServerContext*, const fleetlink::v1::GetVehicleRequest*, fleetlink::v1::VehicleView*) override;
  ::grpc::Status ListEvents(::grpc::ServerContext*, const fleetlink::v1::ListEventsRequest*, fleetlink::v1::ListEventsResponse*) override;

  ::grpc::Status DispatchMission(::grpc::ServerContext*, const fleetlink::v1::DispatchMissionRequest*, fleetlink::v1::MissionView*) override;
  ::grpc::Status GetMission(::grpc::ServerContext*, const fleetlink::v1::GetMissionRequest*, fleetlink::v1::MissionView*) override;
  ::grpc::Status ListMissions(::grpc::ServerContext*, const fleetlink::v1::ListMissionsRequest*, fleetlink::v1::ListMissionsResponse*) override;
  ::grpc::Status SendInstantAction(::grpc::ServerContext*, const fleetlink::v1::SendInstantActionRequest*,
                                   fleetlink::v1::SendInstantActionResponse*) override;

  ::grpc::Status GetHealth(::grpc::ServerContext*, const fleetlink::v1::GetHealthRequest*, fleetlink::v1::HealthView*) override;
  ::grpc::Status Reconnect(::grpc::ServerContext*, const fleetlink::v1::ReconnectRequest*, fleetlink::v1::HealthView*) override;
  ::grpc::Status UpdateBrokerConfig(::grpc::ServerContext*, const fleetlink::v1::UpdateBrokerConfigRequest*,
                                    fleetlink::v1::UpdateBrokerConfigResponse*) override;

 private:
  std::shared_ptr<fleetlink::service::FleetService> service_;
};

} // namespace fleetlink::grpc
