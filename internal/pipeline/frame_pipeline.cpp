#include "frame_pipeline.hpp"

#include <variant>

#include "internal/mission/mission_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/protocol/protocol_codec.hpp"
#include "internal/telemetry/telemetry_store.hpp"
#include "internal/util/errors.hpp"

namespace fleetlink::pipeline {

using fleetlink::observability::IntField;
using fleetlink::observability::StringField;
using fleetlink::observability::VehicleField;

FramePipeline::FramePipeline(std::shared_ptr<protocol::ProtocolCodec> codec, std::shared_ptr<telemetry::TelemetryStore> telemetry,
                             std::shared_ptr<mission::MissionDispatcher> dispatcher)
    : codec_(std::move(codec)), telemetry_(std::move(telemetry)), dispatcher_(std::move(dispatcher)) {
}

void FramePipeline::Handle(const std::string& topic, const std::string& payload, util::TimePoint arrived_at) {
  protocol::DecodedFrame frame;
  try {
    frame = codec_->Decode(topic, payload);
  } catch (const util::ProtocolError& e) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    observability::Metrics::Instance().RecordDecodeFailure("protocol");
    FLEETLINK_LOG_WARN("Dropping malformed message", {StringField("topic", topic), StringField("error", e.what())});
    return;
  }

  if (!codec_->Admit(frame)) {
    duplicate_.fetch_add(1, std::memory_order_relaxed);
    FLEETLINK_LOG_DEBUG("Dropping replayed message",
                        {VehicleField(frame.vehicle_id), StringField("topic", topic), IntField("header_id", frame.header_id)});
    return;
  }
  accepted_.fetch_add(1, std::memory_order_relaxed);
  observability::Metrics::Instance().RecordInboundMessage(protocol::ToString(frame.topic.kind));

  const auto& vehicle    = frame.topic.vehicle;
  const auto  header_id  = frame.header_id;
  const auto  message_at = frame.message_time;

  if (const auto* state = std::get_if<fleetlink::v1::State>(&frame.message)) {
    telemetry_->Merge(frame.vehicle_id, arrived_at, [&](telemetry::VehicleRecord& record) {
      record.manufacturer   = vehicle.manufacturer;
      record.serial_number  = vehicle.serial_number;
      record.state          = *state;
      record.has_state      = true;
      record.last_header_id = header_id;
      record.message_time   = message_at;
    });
    if (dispatcher_) {
      dispatcher_->OnState(frame.vehicle_id, *state);
    }
  } else if (const auto* connection = std::get_if<fleetlink::v1::Connection>(&frame.message)) {
    // OFFLINE / CONNECTIONBROKEN demote in the same write that records the report
    const auto link = connection->connection_state() == "ONLINE" ? telemetry::LinkState::kOnline : telemetry::LinkState::kOffline;
    telemetry_->Merge(frame.vehicle_id, arrived_at, link, [&](telemetry::VehicleRecord& record) {
      record.manufacturer        = vehicle.manufacturer;
      record.serial_number       = vehicle.serial_number;
      record.reported_connection = connection->connection_state();
      record.message_time        = message_at;
    });
    FLEETLINK_LOG_INFO("Vehicle connection state", {VehicleField(frame.vehicle_id), StringField("state", connection->connection_state())});
  } else if (const auto* visualization = std::get_if<fleetlink::v1::Visualization>(&frame.message)) {
    telemetry_->Merge(frame.vehicle_id, arrived_at, [&](telemetry::VehicleRecord& record) {
      record.manufacturer  = vehicle.manufacturer;
      record.serial_number = vehicle.serial_number;
      if (visualization->has_agv_position()) {
        *record.state.mutable_agv_position() = visualization->agv_position();
      }
      record.message_time = message_at;
    });
  }

  telemetry::TelemetryEvent event;
  event.kind       = frame.topic.kind;
  event.header_id  = header_id;
  event.arrived_at = arrived_at;
  event.payload    = payload;
  telemetry_->AppendEvent(frame.vehicle_id, std::move(event));
}

PipelineCounters FramePipeline::Counters() const {
  PipelineCounters counters;
  counters.accepted  = accepted_.load(std::memory_order_relaxed);
  counters.duplicate = duplicate_.load(std::memory_order_relaxed);
  counters.rejected  = rejected_.load(std::memory_order_relaxed);
  return counters;
}

} // namespace fleetlink::pipeline
