#include "fleet_server.hpp"

#include "fleetlink/v1.hpp"
#include "grpc_error.hpp"

namespace fleetlink::grpc {

using namespace fleetlink::v1;

FleetServer::FleetServer(std::shared_ptr<fleetlink::service::FleetService> svc) : service_(std::move(svc)) {
}

::grpc::Status FleetServer::ListVehicles(::grpc::ServerContext*, const ListVehiclesRequest* req, ListVehiclesResponse* resp) {
  try {
    *resp = service_->ListVehicles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::GetVehicle(::grpc::ServerContext*, const GetVehicleRequest* req, VehicleView* resp) {
  try {
    *resp = service_->GetVehicle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::ListEvents(::grpc::ServerContext*, const ListEventsRequest* req, ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::DispatchMission(::grpc::ServerContext*, const DispatchMissionRequest* req, MissionView* resp) {
  try {
    *resp = service_->DispatchMission(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::GetMission(::grpc::ServerContext*, const GetMissionRequest* req, MissionView* resp) {
  try {
    *resp = service_->GetMission(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::ListMissions(::grpc::ServerContext*, const ListMissionsRequest* req, ListMissionsResponse* resp) {
  try {
    *resp = service_->ListMissions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::SendInstantAction(::grpc::ServerContext*, const SendInstantActionRequest* req, SendInstantActionResponse* resp) {
  try {
    *resp = service_->SendInstantAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::GetHealth(::grpc::ServerContext*, const GetHealthRequest* req, HealthView* resp) {
  try {
    *resp = service_->GetHealth(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::Reconnect(::grpc::ServerContext*, const ReconnectRequest* req, HealthView* resp) {
  try {
    *resp = service_->Reconnect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FleetServer::UpdateBrokerConfig(::grpc::ServerContext*, const UpdateBrokerConfigRequest* req, UpdateBrokerConfigResponse* resp) {
  try {
    *resp = service_->UpdateBrokerConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fleetlink::grpc
