#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "fleetlink/v1.hpp"
#include "fleetlink/v1/fleet_service.grpc.pb.h"

using namespace fleetlink::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl <addr> vehicles\n"
            << "  fleetctl <addr> vehicle <manufacturer/serial>\n"
            << "  fleetctl <addr> events <manufacturer/serial> [state|connection|visualization]\n"
            << "  fleetctl <addr> dispatch <manufacturer/serial> <route_file> [order_id]\n"
            << "  fleetctl <addr> mission <order_id>\n"
            << "  fleetctl <addr> missions\n"
            << "  fleetctl <addr> pause <manufacturer/serial>\n"
            << "  fleetctl <addr> resume <manufacturer/serial>\n"
            << "  fleetctl <addr> cancel <manufacturer/serial>\n"
            << "  fleetctl <addr> health\n"
            << "  fleetctl <addr> reconnect\n"
            << "  fleetctl <addr> broker <host> [port] [tls=0|1] [username] [password]\n";
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static const char* LinkStateName(LinkState state) {
  switch (state) {
    case LINK_STATE_ONLINE:
      return "ONLINE";
    case LINK_STATE_STALE:
      return "STALE";
    case LINK_STATE_OFFLINE:
      return "OFFLINE";
    default:
      return "UNSPECIFIED";
  }
}

static const char* AckStateName(AckState state) {
  switch (state) {
    case ACK_STATE_PENDING:
      return "PENDING";
    case ACK_STATE_ACKED:
      return "ACKED";
    case ACK_STATE_FAILED:
      return "FAILED";
    case ACK_STATE_TIMEOUT:
      return "TIMEOUT";
    default:
      return "UNSPECIFIED";
  }
}

static const char* HealthStatusName(HealthStatus status) {
  switch (status) {
    case HEALTH_STATUS_HEALTHY:
      return "HEALTHY";
    case HEALTH_STATUS_RECONNECTING:
      return "RECONNECTING";
    case HEALTH_STATUS_DEGRADED:
      return "DEGRADED";
    case HEALTH_STATUS_FAILED:
      return "FAILED";
    default:
      return "UNSPECIFIED";
  }
}

static void PrintVehicle(const VehicleView& v) {
  std::cout << v.vehicle_id() << " link=" << LinkStateName(v.link_state()) << " battery=" << v.battery_charge() << " x=" << v.x() << " y=" << v.y()
            << " theta=" << v.theta() << " order=" << v.order_id() << " errors=" << v.errors_size() << "\n";
}

static void PrintMission(const MissionView& m) {
  std::cout << m.order_id() << " vehicle=" << m.vehicle_id() << " update=" << m.order_update_id() << " nodes=" << m.nodes_size()
            << " state=" << AckStateName(m.ack_state());
  if (!m.detail().empty()) {
    std::cout << " detail=\"" << m.detail() << "\"";
  }
  std::cout << "\n";
}

static void PrintHealth(const HealthView& h) {
  std::cout << "status=" << HealthStatusName(h.status()) << "\n";
  std::cout << "session_id=" << h.session_id() << "\n";
  std::cout << "reconnect_attempts=" << h.reconnect_attempts() << "\n";
  std::cout << "consecutive_misses=" << h.consecutive_misses() << "\n";
  std::cout << "decode_failures=" << h.decode_failures() << "\n";
  std::cout << "vehicles=" << h.vehicles_online() << "/" << h.vehicles_stale() << "/" << h.vehicles_offline() << " (online/stale/offline)\n";
  if (!h.last_error().empty()) {
    std::cout << "last_error=" << h.last_error() << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = FleetService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "vehicles") {
    ListVehiclesRequest  req;
    ListVehiclesResponse resp;

    auto status = stub->ListVehicles(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& v : resp.vehicles()) PrintVehicle(v);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "vehicle") {
    if (argc < 4) return 1;

    GetVehicleRequest req;
    req.set_vehicle_id(argv[3]);
    VehicleView resp;

    auto status = stub->GetVehicle(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintVehicle(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    if (argc < 4) return 1;

    ListEventsRequest req;
    req.set_vehicle_id(argv[3]);
    if (argc >= 5) req.set_topic(argv[4]);
    ListEventsResponse resp;

    auto status = stub->ListEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& e : resp.events()) {
      std::cout << e.arrived_at_ms() << " " << e.topic() << " #" << e.header_id() << " " << e.payload() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "dispatch") {
    if (argc < 5) return 1;

    auto text = ReadFile(argv[4]);
    if (!text.has_value()) {
      std::cerr << "cannot read route file: " << argv[4] << "\n";
      return 1;
    }

    DispatchMissionRequest req;
    req.set_vehicle_id(argv[3]);
    req.set_nodes_text(*text);
    if (argc >= 6) req.set_order_id(argv[5]);
    MissionView resp;

    auto status = stub->DispatchMission(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintMission(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "mission") {
    if (argc < 4) return 1;

    GetMissionRequest req;
    req.set_order_id(argv[3]);
    MissionView resp;

    auto status = stub->GetMission(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintMission(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "missions") {
    ListMissionsRequest  req;
    ListMissionsResponse resp;

    auto status = stub->ListMissions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& m : resp.missions()) PrintMission(m);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause" || cmd == "resume" || cmd == "cancel") {
    if (argc < 4) return 1;

    SendInstantActionRequest req;
    req.set_vehicle_id(argv[3]);
    if (cmd == "pause") {
      req.set_action(INSTANT_ACTION_TYPE_START_PAUSE);
    } else if (cmd == "resume") {
      req.set_action(INSTANT_ACTION_TYPE_STOP_PAUSE);
    } else {
      req.set_action(INSTANT_ACTION_TYPE_CANCEL_ORDER);
    }
    SendInstantActionResponse resp;

    auto status = stub->SendInstantAction(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "action=" << resp.action_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    GetHealthRequest req;
    HealthView       resp;

    auto status = stub->GetHealth(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintHealth(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconnect") {
    ReconnectRequest req;
    HealthView       resp;

    auto status = stub->Reconnect(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintHealth(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "broker") {
    if (argc < 4) return 1;

    UpdateBrokerConfigRequest req;
    req.set_host(argv[3]);
    if (argc >= 5) req.set_port(static_cast<uint32_t>(std::stoul(argv[4])));
    if (argc >= 6) req.set_use_tls(std::string(argv[5]) == "1");
    if (argc >= 7) req.set_username(argv[6]);
    if (argc >= 8) req.set_password(argv[7]);
    UpdateBrokerConfigResponse resp;

    auto status = stub->UpdateBrokerConfig(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "updated\n";
    return 0;
  }

  Usage();
  return 1;
}
