#include "mission_dispatcher.hpp"

#include <algorithm>

#include "internal/connection/connection_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/protocol/protocol_codec.hpp"
#include "internal/telemetry/telemetry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "order_id.hpp"

namespace fleetlink::mission {

using fleetlink::observability::IntField;
using fleetlink::observability::OrderField;
using fleetlink::observability::StringField;
using fleetlink::observability::VehicleField;
using fleetlink::util::MissionError;
using fleetlink::util::NotFound;
using fleetlink::util::PublishError;

std::string_view ToString(AckState state) {
  switch (state) {
    case AckState::kPending:
      return "PENDING";
    case AckState::kAcked:
      return "ACKED";
    case AckState::kFailed:
      return "FAILED";
    case AckState::kTimeout:
      return "TIMEOUT";
  }
  return "UNKNOWN";
}

std::string_view ActionType(InstantAction action) {
  switch (action) {
    case InstantAction::kStartPause:
      return "startPause";
    case InstantAction::kStopPause:
      return "stopPause";
    case InstantAction::kCancelOrder:
      return "cancelOrder";
  }
  return "unknown";
}

namespace {

bool IsOrderRejection(const std::string& error_type) {
  return error_type == "orderError" || error_type == "orderUpdateError" || error_type == "noRouteError";
}

protocol::VehicleKey TargetVehicle(const std::string& vehicle_id, const telemetry::TelemetryStore& telemetry) {
  protocol::VehicleKey vehicle;
  try {
    vehicle = protocol::VehicleKey::FromId(vehicle_id);
  } catch (const util::ProtocolError& e) {
    throw MissionError(e.what());
  }
  if (!telemetry.Get(vehicle_id)) {
    throw MissionError("unknown vehicle '" + vehicle_id + "'");
  }
  return vehicle;
}

/*
  Nodes carry even sequence ids, edges the odd id between their endpoints.
  A route without any sequence ids gets 0, 2, 4, ...
*/
void NormalizeRoute(std::vector<fleetlink::v1::Node>& nodes, std::vector<fleetlink::v1::Edge>& edges) {
  const bool unsequenced =
      nodes.size() > 1 && std::all_of(nodes.begin(), nodes.end(), [](const fleetlink::v1::Node& n) { return n.sequence_id() == 0; });
  if (unsequenced) {
    for (size_t i = 0; i < nodes.size(); ++i) {
      nodes[i].set_sequence_id(static_cast<uint32_t>(2 * i));
    }
  }

  for (size_t i = 0; i < nodes.size(); ++i) {
    if (nodes[i].node_id().empty()) {
      throw MissionError("node " + std::to_string(i) + " has no nodeId");
    }
    if (i > 0 && nodes[i].sequence_id() <= nodes[i - 1].sequence_id()) {
      throw MissionError("node sequence ids must be strictly increasing (at node '" + nodes[i].node_id() + "')");
    }
    nodes[i].set_released(true);
  }

  if (edges.empty()) {
    for (size_t i = 0; i + 1 < nodes.size(); ++i) {
      const auto& a = nodes[i];
      const auto& b = nodes[i + 1];
      if (a.sequence_id() + 1 >= b.sequence_id()) {
        throw MissionError("no sequence id left for the edge between '" + a.node_id() + "' and '" + b.node_id() + "'");
      }
      fleetlink::v1::Edge edge;
      edge.set_edge_id(a.node_id() + "-" + b.node_id());
      edge.set_sequence_id(a.sequence_id() + 1);
      edge.set_start_node_id(a.node_id());
      edge.set_end_node_id(b.node_id());
      edges.push_back(std::move(edge));
    }
  } else {
    if (edges.size() + 1 != nodes.size()) {
      throw MissionError("expected " + std::to_string(nodes.size() - 1) + " edges, got " + std::to_string(edges.size()));
    }
    for (size_t i = 0; i < edges.size(); ++i) {
      const auto& edge = edges[i];
      const auto& a    = nodes[i];
      const auto& b    = nodes[i + 1];
      if (edge.edge_id().empty()) {
        throw MissionError("edge " + std::to_string(i) + " has no edgeId");
      }
      if (edge.start_node_id() != a.node_id() || edge.end_node_id() != b.node_id()) {
        throw MissionError("edge '" + edge.edge_id() + "' does not connect '" + a.node_id() + "' to '" + b.node_id() + "'");
      }
      if (edge.sequence_id() <= a.sequence_id() || edge.sequence_id() >= b.sequence_id()) {
        throw MissionError("edge '" + edge.edge_id() + "' sequence id is out of order");
      }
    }
  }
  for (auto& edge : edges) {
    edge.set_released(true);
  }
}

} // namespace

MissionDispatcher::MissionDispatcher(std::shared_ptr<protocol::ProtocolCodec> codec, std::shared_ptr<connection::ConnectionManager> connection,
                                     std::shared_ptr<telemetry::TelemetryStore> telemetry, DispatcherOptions options)
    : codec_(std::move(codec)), connection_(std::move(connection)), telemetry_(std::move(telemetry)), options_(std::move(options)) {
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

MissionOrder MissionDispatcher::Dispatch(MissionRequest request) {
  return Dispatch(std::move(request), util::Now());
}

MissionOrder MissionDispatcher::Dispatch(MissionRequest request, util::TimePoint now) {
  if (request.nodes.empty()) {
    throw MissionError("order has no nodes");
  }
  if (request.nodes.size() > options_.max_nodes) {
    throw MissionError("too many nodes: " + std::to_string(request.nodes.size()) + " (maximum " + std::to_string(options_.max_nodes) + ")");
  }
  if (!request.order_id.empty() && !IsValidOrderId(request.order_id)) {
    throw MissionError("invalid orderId '" + request.order_id + "': only letters, digits, '_' and '-' are allowed");
  }
  const auto vehicle = TargetVehicle(request.vehicle_id, *telemetry_);
  NormalizeRoute(request.nodes, request.edges);

  if (!connection_->IsConnected()) {
    throw PublishError("cannot dispatch: broker session is " + std::string(connection::ToString(connection_->State())));
  }

  protocol::EncodedMessage    encoded;
  MissionOrder                record;
  std::optional<MissionOrder> previous;
  {
    std::lock_guard lock(mutex_);

    std::string order_id = request.order_id;
    if (order_id.empty()) {
      order_id = GenerateOrderId(options_.order_prefix, now, [this](const std::string& id) { return orders_.count(id) > 0; });
    }
    auto existing = orders_.find(order_id);
    if (existing != orders_.end()) {
      if (existing->second.vehicle_id != request.vehicle_id) {
        throw MissionError("order '" + order_id + "' belongs to vehicle '" + existing->second.vehicle_id + "'");
      }
      previous = existing->second;
    }

    fleetlink::v1::Order order;
    order.set_order_id(order_id);
    order.set_manufacturer(vehicle.manufacturer);
    order.set_serial_number(vehicle.serial_number);
    for (const auto& node : request.nodes) {
      *order.add_nodes() = node;
    }
    for (const auto& edge : request.edges) {
      *order.add_edges() = edge;
    }
    encoded = codec_->EncodeOrder(order);

    record.order_id        = order_id;
    record.order_update_id = order.order_update_id();
    record.vehicle_id      = request.vehicle_id;
    record.nodes           = std::move(request.nodes);
    record.edges           = std::move(request.edges);
    record.dispatched_at   = now;
    record.ack_deadline    = now + request.ack_timeout.value_or(options_.ack_timeout);
    record.ack_state       = AckState::kPending;
    orders_[order_id]      = record;
  }

  try {
    connection_->Publish(encoded.topic, encoded.payload);
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      if (previous) {
        orders_[record.order_id] = *previous;
      } else {
        orders_.erase(record.order_id);
      }
    }
    FLEETLINK_LOG_WARN("Mission dispatch failed", {OrderField(record.order_id), VehicleField(record.vehicle_id),
                                                   StringField("error", e.what())});
    throw;
  }

  FLEETLINK_LOG_INFO("Mission dispatched", {OrderField(record.order_id), IntField("order_update_id", record.order_update_id),
                                            VehicleField(record.vehicle_id), IntField("nodes", static_cast<int64_t>(record.nodes.size()))});
  return record;
}

std::string MissionDispatcher::SendInstantAction(const std::string& vehicle_id, InstantAction action) {
  const auto vehicle = TargetVehicle(vehicle_id, *telemetry_);
  if (!connection_->IsConnected()) {
    throw PublishError("cannot send " + std::string(ActionType(action)) + ": broker session is " + std::string(connection::ToString(connection_->State())));
  }

  fleetlink::v1::Action instant;
  instant.set_action_type(std::string(ActionType(action)));
  instant.set_action_id(std::string(ActionType(action)) + "-" + util::ToString(util::GenerateUUID()));
  instant.set_blocking_type(action == InstantAction::kCancelOrder ? "NONE" : "HARD");

  const auto encoded = codec_->EncodeInstantActions(vehicle, {instant});
  connection_->Publish(encoded.topic, encoded.payload);

  FLEETLINK_LOG_INFO("Instant action sent", {VehicleField(vehicle_id), StringField("action_type", instant.action_type()),
                                             StringField("action_id", instant.action_id())});
  return instant.action_id();
}

// ------------------------------------------------------------
// Acknowledgement tracking
// ------------------------------------------------------------

void MissionDispatcher::Settle(MissionOrder& order, AckState state, std::string detail, std::vector<MissionOrder>* settled) {
  order.ack_state = state;
  order.detail    = std::move(detail);
  terminal_.push_back(order.order_id);
  settled->push_back(order);
  observability::Metrics::Instance().RecordMissionOutcome(ToString(state));
}

void MissionDispatcher::TrimHistory() {
  while (terminal_.size() > options_.history_limit) {
    const auto id = std::move(terminal_.front());
    terminal_.pop_front();
    auto it = orders_.find(id);
    if (it != orders_.end() && it->second.ack_state != AckState::kPending) {
      orders_.erase(it);
    }
  }
}

void MissionDispatcher::OnState(const std::string& vehicle_id, const fleetlink::v1::State& state) {
  std::vector<MissionOrder> settled;
  {
    std::lock_guard lock(mutex_);

    for (const auto& error : state.errors()) {
      if (!IsOrderRejection(error.error_type())) {
        continue;
      }
      for (const auto& ref : error.error_references()) {
        if (ref.reference_key() != "orderId") {
          continue;
        }
        auto it = orders_.find(ref.reference_value());
        if (it == orders_.end() || it->second.vehicle_id != vehicle_id || it->second.ack_state != AckState::kPending) {
          continue;
        }
        std::string detail = error.error_type();
        if (!error.error_description().empty()) {
          detail += ": " + error.error_description();
        }
        Settle(it->second, AckState::kFailed, std::move(detail), &settled);
      }
    }

    if (!state.order_id().empty()) {
      auto it = orders_.find(state.order_id());
      if (it != orders_.end() && it->second.vehicle_id == vehicle_id && it->second.ack_state == AckState::kPending &&
          state.order_update_id() >= it->second.order_update_id) {
        Settle(it->second, AckState::kAcked, "accepted by vehicle", &settled);
      }
    }

    TrimHistory();
  }

  for (const auto& order : settled) {
    FLEETLINK_LOG_INFO("Mission settled", {OrderField(order.order_id), VehicleField(order.vehicle_id),
                                           StringField("ack_state", ToString(order.ack_state)), StringField("detail", order.detail)});
  }
  Notify(settled);
}

std::vector<MissionOrder> MissionDispatcher::ExpireOverdue(util::TimePoint now) {
  std::vector<MissionOrder> settled;
  {
    std::lock_guard lock(mutex_);
    for (auto& [order_id, order] : orders_) {
      if (order.ack_state != AckState::kPending || now < order.ack_deadline) {
        continue;
      }
      const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(order.ack_deadline - order.dispatched_at);
      Settle(order, AckState::kTimeout, "no acknowledgement within " + std::to_string(waited.count()) + "ms", &settled);
    }
    TrimHistory();
  }

  for (const auto& order : settled) {
    FLEETLINK_LOG_WARN("Mission acknowledgement timed out",
                       {OrderField(order.order_id), VehicleField(order.vehicle_id), StringField("detail", order.detail)});
  }
  Notify(settled);
  return settled;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

MissionOrder MissionDispatcher::Get(const std::string& order_id) const {
  std::lock_guard lock(mutex_);
  auto            it = orders_.find(order_id);
  if (it == orders_.end()) {
    throw NotFound("order not found: " + order_id);
  }
  return it->second;
}

std::vector<MissionOrder> MissionDispatcher::List() const {
  std::vector<MissionOrder> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(orders_.size());
    for (const auto& [order_id, order] : orders_) {
      out.push_back(order);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const MissionOrder& a, const MissionOrder& b) { return a.dispatched_at < b.dispatched_at; });
  return out;
}

void MissionDispatcher::SetOutcomeListener(OutcomeListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

void MissionDispatcher::Notify(const std::vector<MissionOrder>& settled) {
  if (settled.empty()) {
    return;
  }
  OutcomeListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (!listener) {
    return;
  }
  for (const auto& order : settled) {
    listener(order);
  }
}

} // namespace fleetlink::mission
