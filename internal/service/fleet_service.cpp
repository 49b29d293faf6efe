#include "fleet_service.hpp"

#include <chrono>

#include "internal/connection/connection_manager.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/health/health_monitor.hpp"
#include "internal/mission/mission_dispatcher.hpp"
#include "internal/mission/route_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/frame_pipeline.hpp"
#include "internal/runtime/fleet_runtime.hpp"
#include "internal/telemetry/telemetry_store.hpp"
#include "internal/util/errors.hpp"

namespace fleetlink::service {

using namespace fleetlink::v1;
using fleetlink::observability::StringField;
using fleetlink::observability::VehicleField;

namespace {

template <typename Fn>
auto RunRpc(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    FLEETLINK_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

fleetlink::v1::LinkState ToProto(telemetry::LinkState state) {
  switch (state) {
    case telemetry::LinkState::kOnline:
      return LINK_STATE_ONLINE;
    case telemetry::LinkState::kStale:
      return LINK_STATE_STALE;
    case telemetry::LinkState::kOffline:
      return LINK_STATE_OFFLINE;
  }
  return LINK_STATE_UNSPECIFIED;
}

fleetlink::v1::AckState ToProto(mission::AckState state) {
  switch (state) {
    case mission::AckState::kPending:
      return ACK_STATE_PENDING;
    case mission::AckState::kAcked:
      return ACK_STATE_ACKED;
    case mission::AckState::kFailed:
      return ACK_STATE_FAILED;
    case mission::AckState::kTimeout:
      return ACK_STATE_TIMEOUT;
  }
  return ACK_STATE_UNSPECIFIED;
}

fleetlink::v1::HealthStatus ToProto(health::HealthStatus status) {
  switch (status) {
    case health::HealthStatus::kHealthy:
      return HEALTH_STATUS_HEALTHY;
    case health::HealthStatus::kReconnecting:
      return HEALTH_STATUS_RECONNECTING;
    case health::HealthStatus::kDegraded:
      return HEALTH_STATUS_DEGRADED;
    case health::HealthStatus::kFailed:
      return HEALTH_STATUS_FAILED;
  }
  return HEALTH_STATUS_UNSPECIFIED;
}

fleetlink::v1::SessionState ToProto(connection::SessionState state) {
  switch (state) {
    case connection::SessionState::kDisconnected:
      return SESSION_STATE_DISCONNECTED;
    case connection::SessionState::kConnecting:
      return SESSION_STATE_CONNECTING;
    case connection::SessionState::kConnected:
      return SESSION_STATE_CONNECTED;
    case connection::SessionState::kDegraded:
      return SESSION_STATE_DEGRADED;
  }
  return SESSION_STATE_UNSPECIFIED;
}

VehicleView ToView(const telemetry::VehicleRecord& record) {
  VehicleView view;
  view.set_vehicle_id(record.vehicle_id);
  view.set_manufacturer(record.manufacturer);
  view.set_serial_number(record.serial_number);
  view.set_link_state(ToProto(record.link_state));
  view.set_reported_connection(record.reported_connection);

  const auto& state = record.state;
  view.set_battery_charge(state.battery_state().battery_charge());
  view.set_charging(state.battery_state().charging());
  view.set_x(state.agv_position().x());
  view.set_y(state.agv_position().y());
  view.set_theta(state.agv_position().theta());
  view.set_map_id(state.agv_position().map_id());
  view.set_operating_mode(state.operating_mode());
  view.set_order_id(state.order_id());
  view.set_order_update_id(state.order_update_id());
  view.set_last_node_id(state.last_node_id());
  view.set_driving(state.driving());
  view.set_paused(state.paused());
  for (const auto& error : state.errors()) {
    auto* out = view.add_errors();
    out->set_error_type(error.error_type());
    out->set_error_level(error.error_level());
    out->set_error_description(error.error_description());
  }

  view.set_message_timestamp(util::ToIso8601(record.message_time));
  view.set_last_seen_at_ms(util::ToUnixMillis(record.last_seen_at));
  view.set_header_id(record.last_header_id);
  return view;
}

MissionView ToView(const mission::MissionOrder& order) {
  MissionView view;
  view.set_order_id(order.order_id);
  view.set_order_update_id(order.order_update_id);
  view.set_vehicle_id(order.vehicle_id);
  for (const auto& node : order.nodes) {
    auto* out = view.add_nodes();
    out->set_node_id(node.node_id());
    out->set_sequence_id(node.sequence_id());
    out->set_x(node.node_position().x());
    out->set_y(node.node_position().y());
    out->set_theta(node.node_position().theta());
    out->set_map_id(node.node_position().map_id());
  }
  for (const auto& edge : order.edges) {
    auto* out = view.add_edges();
    out->set_edge_id(edge.edge_id());
    out->set_sequence_id(edge.sequence_id());
    out->set_start_node_id(edge.start_node_id());
    out->set_end_node_id(edge.end_node_id());
  }
  view.set_dispatched_at_ms(util::ToUnixMillis(order.dispatched_at));
  view.set_ack_deadline_ms(util::ToUnixMillis(order.ack_deadline));
  view.set_ack_state(ToProto(order.ack_state));
  view.set_detail(order.detail);
  return view;
}

fleetlink::v1::Node MakeNode(const std::string& node_id, uint32_t sequence_id, double x, double y, double theta, const std::string& map_id) {
  fleetlink::v1::Node node;
  node.set_node_id(node_id);
  node.set_sequence_id(sequence_id);
  auto* position = node.mutable_node_position();
  position->set_x(x);
  position->set_y(y);
  position->set_theta(theta);
  position->set_map_id(map_id);
  return node;
}

} // namespace

FleetService::FleetService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------

ListVehiclesResponse FleetService::ListVehicles(const ListVehiclesRequest&) {
  return RunRpc("FleetService.ListVehicles", [&] {
    ctx_.runtime->Attach();
    ListVehiclesResponse resp;
    for (const auto& [vehicle_id, record] : *ctx_.runtime->Telemetry()->SnapshotAll()) {
      *resp.add_vehicles() = ToView(*record);
    }
    return resp;
  });
}

VehicleView FleetService::GetVehicle(const GetVehicleRequest& req) {
  return RunRpc("FleetService.GetVehicle", [&] {
    ctx_.runtime->Attach();
    const auto record = ctx_.runtime->Telemetry()->Get(req.vehicle_id());
    if (!record) {
      throw util::NotFound("vehicle not found: " + req.vehicle_id());
    }
    return ToView(*record);
  });
}

ListEventsResponse FleetService::ListEvents(const ListEventsRequest& req) {
  return RunRpc("FleetService.ListEvents", [&] {
    ctx_.runtime->Attach();

    auto kind = protocol::TopicKind::kUnknown;
    if (!req.topic().empty()) {
      kind = protocol::ParseTopicKind(req.topic());
      if (kind == protocol::TopicKind::kUnknown) {
        throw util::ProtocolError("unknown topic '" + req.topic() + "'");
      }
    }

    ListEventsResponse resp;
    for (const auto& event : ctx_.runtime->Telemetry()->Events(req.vehicle_id(), kind)) {
      auto* out = resp.add_events();
      out->set_topic(std::string(protocol::ToString(event.kind)));
      out->set_header_id(event.header_id);
      out->set_arrived_at_ms(util::ToUnixMillis(event.arrived_at));
      out->set_payload(event.payload);
    }
    return resp;
  });
}

// ------------------------------------------------------------
// Missions
// ------------------------------------------------------------

MissionView FleetService::DispatchMission(const DispatchMissionRequest& req) {
  return RunRpc("FleetService.DispatchMission", [&] {
    ctx_.runtime->Attach();
    const auto& options = ctx_.runtime->Options();

    mission::MissionRequest request;
    request.vehicle_id = req.vehicle_id();
    request.order_id   = req.order_id();

    if (!req.nodes_text().empty()) {
      if (req.nodes_size() > 0) {
        throw util::MissionError("give either nodes or nodes_text, not both");
      }
      const auto route = mission::ParseRoute(req.nodes_text(), options.route);
      for (const auto& warning : route.warnings) {
        FLEETLINK_LOG_WARN("Route warning", {VehicleField(req.vehicle_id()), StringField("warning", warning)});
      }
      for (const auto& node : route.nodes) {
        request.nodes.push_back(MakeNode(node.node_id, 0, node.x, node.y, node.theta, options.default_map_id));
      }
    } else {
      for (const auto& node : req.nodes()) {
        request.nodes.push_back(MakeNode(node.node_id(), node.sequence_id(), node.x(), node.y(), mission::NormalizeTheta(node.theta()),
                                         node.map_id().empty() ? options.default_map_id : node.map_id()));
      }
    }

    for (const auto& edge : req.edges()) {
      fleetlink::v1::Edge out;
      out.set_edge_id(edge.edge_id());
      out.set_sequence_id(edge.sequence_id());
      out.set_start_node_id(edge.start_node_id());
      out.set_end_node_id(edge.end_node_id());
      request.edges.push_back(std::move(out));
    }
    if (req.ack_timeout_ms() != 0) {
      request.ack_timeout = std::chrono::milliseconds(req.ack_timeout_ms());
    }

    return ToView(ctx_.runtime->Dispatcher()->Dispatch(std::move(request)));
  });
}

MissionView FleetService::GetMission(const GetMissionRequest& req) {
  return RunRpc("FleetService.GetMission", [&] {
    ctx_.runtime->Attach();
    return ToView(ctx_.runtime->Dispatcher()->Get(req.order_id()));
  });
}

ListMissionsResponse FleetService::ListMissions(const ListMissionsRequest&) {
  return RunRpc("FleetService.ListMissions", [&] {
    ctx_.runtime->Attach();
    ListMissionsResponse resp;
    for (const auto& order : ctx_.runtime->Dispatcher()->List()) {
      *resp.add_missions() = ToView(order);
    }
    return resp;
  });
}

SendInstantActionResponse FleetService::SendInstantAction(const SendInstantActionRequest& req) {
  return RunRpc("FleetService.SendInstantAction", [&] {
    ctx_.runtime->Attach();

    mission::InstantAction action;
    switch (req.action()) {
      case INSTANT_ACTION_TYPE_START_PAUSE:
        action = mission::InstantAction::kStartPause;
        break;
      case INSTANT_ACTION_TYPE_STOP_PAUSE:
        action = mission::InstantAction::kStopPause;
        break;
      case INSTANT_ACTION_TYPE_CANCEL_ORDER:
        action = mission::InstantAction::kCancelOrder;
        break;
      default:
        throw util::MissionError("unsupported instant action");
    }

    SendInstantActionResponse resp;
    resp.set_action_id(ctx_.runtime->Dispatcher()->SendInstantAction(req.vehicle_id(), action));
    return resp;
  });
}

// ------------------------------------------------------------
// Health / broker
// ------------------------------------------------------------

HealthView FleetService::GetHealth(const GetHealthRequest&) {
  return RunRpc("FleetService.GetHealth", [&] {
    ctx_.runtime->Attach();

    const auto report  = ctx_.runtime->Health()->Report();
    const auto session = ctx_.runtime->Connection()->Session();
    const auto counts  = ctx_.runtime->Telemetry()->Counts();

    HealthView view;
    view.set_status(ToProto(report.status));
    view.set_session_state(ToProto(session.state));
    view.set_session_id(session.session_id);
    view.set_reconnect_attempts(report.reconnect_attempts);
    view.set_consecutive_misses(report.consecutive_misses);
    if (report.last_check_at) {
      view.set_last_health_check_ms(util::ToUnixMillis(*report.last_check_at));
    }
    view.set_last_error(report.last_error.empty() ? session.last_error : report.last_error);
    view.set_decode_failures(ctx_.runtime->Pipeline()->Counters().rejected);
    view.set_vehicles_online(counts.online);
    view.set_vehicles_stale(counts.stale);
    view.set_vehicles_offline(counts.offline);
    return view;
  });
}

HealthView FleetService::Reconnect(const ReconnectRequest&) {
  RunRpc("FleetService.Reconnect", [&] { ctx_.runtime->Reconnect(); });
  return GetHealth(GetHealthRequest{});
}

UpdateBrokerConfigResponse FleetService::UpdateBrokerConfig(const UpdateBrokerConfigRequest& req) {
  return RunRpc("FleetService.UpdateBrokerConfig", [&] {
    if (req.host().empty()) {
      throw util::ConfigError("broker host is required");
    }
    if (req.port() > 65535) {
      throw util::ConfigError("broker port out of range: " + std::to_string(req.port()));
    }

    credentials::BrokerConfig config;
    try {
      config = ctx_.runtime->Credentials()->Get();
    } catch (const util::ConfigError& e) {
      FLEETLINK_LOG_WARN("Replacing unreadable stored broker configuration", {StringField("error", e.what())});
    }

    config.host      = req.host();
    config.use_tls   = req.use_tls();
    config.username  = req.username();
    config.client_id = req.client_id();
    config.ca_file   = req.ca_file();
    if (req.port() != 0) {
      config.port = req.port();
    }
    // an empty password keeps the stored one unless the username was cleared
    if (!req.password().empty() || req.username().empty()) {
      config.password = req.password();
    }

    ctx_.runtime->Attach();
    ctx_.runtime->UpdateBrokerConfig(config);
    return UpdateBrokerConfigResponse{};
  });
}

} // namespace fleetlink::service
