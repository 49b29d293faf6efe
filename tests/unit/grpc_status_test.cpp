#include <grpcpp/grpcpp.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "fleetlink/v1.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/credentials/secret_cipher.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/fleet_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/runtime/fleet_runtime.hpp"
#include "internal/service/fleet_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/fakes/fake_broker_client.hpp"

namespace {

using fleetlink::util::ConnectionError;

std::shared_ptr<fleetlink::runtime::FleetRuntime> BuildRuntime() {
  const auto path = std::filesystem::temp_directory_path() / "fleetlink_grpc_status_test.db";
  std::filesystem::remove(path);

  auto db          = std::make_shared<fleetlink::db::sqlite::SqliteDB>(path.string());
  auto cipher      = std::make_shared<fleetlink::credentials::SecretCipher>(fleetlink::credentials::SecretCipher::GenerateKey());
  auto credentials = std::make_shared<fleetlink::credentials::CredentialStore>(db, cipher);
  return std::make_shared<fleetlink::runtime::FleetRuntime>(fleetlink::config::RuntimeOptions{}, credentials,
                                                            std::make_shared<fleetlink::testing::FakeBrokerClient>());
}

void TestExceptionMapping() {
  using fleetlink::grpc::ToStatus;
  assert(ToStatus(fleetlink::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(fleetlink::util::MissionError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(fleetlink::util::ProtocolError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(fleetlink::util::ConfigError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(fleetlink::util::PublishError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(ConnectionError(ConnectionError::Kind::kAuth, "x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(ConnectionError(ConnectionError::Kind::kCancelled, "x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestAdapterTranslatesServiceErrors() {
  auto runtime = BuildRuntime();
  auto service = std::make_shared<fleetlink::service::FleetService>(fleetlink::service::ServiceContext{runtime});
  fleetlink::grpc::FleetServer server(service);
  ::grpc::ServerContext        grpc_ctx;

  fleetlink::v1::GetVehicleRequest vehicle_req;
  vehicle_req.set_vehicle_id("acme/agv-404");
  fleetlink::v1::VehicleView vehicle_resp;
  assert(server.GetVehicle(&grpc_ctx, &vehicle_req, &vehicle_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  fleetlink::v1::DispatchMissionRequest dispatch_req;
  dispatch_req.set_vehicle_id("acme/agv-404");
  dispatch_req.set_nodes_text("a,0,0,0\nb,1,1,0");
  fleetlink::v1::MissionView mission_resp;
  assert(server.DispatchMission(&grpc_ctx, &dispatch_req, &mission_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  fleetlink::v1::UpdateBrokerConfigRequest update_req;
  fleetlink::v1::UpdateBrokerConfigResponse update_resp;
  assert(server.UpdateBrokerConfig(&grpc_ctx, &update_req, &update_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  fleetlink::v1::GetHealthRequest health_req;
  fleetlink::v1::HealthView       health_resp;
  assert(server.GetHealth(&grpc_ctx, &health_req, &health_resp).ok());

  runtime->Shutdown();
}

} // namespace

int main() {
  TestExceptionMapping();
  TestAdapterTranslatesServiceErrors();

  std::cout << "fleetlink_unit_grpc_status: pass\n";
  return 0;
}
