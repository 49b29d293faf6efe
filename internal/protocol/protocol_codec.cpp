#include "protocol_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace fleetlink::protocol {

using fleetlink::util::ProtocolError;

namespace {

google::protobuf::util::JsonParseOptions InboundParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

google::protobuf::util::JsonPrintOptions OutboundPrintOptions() {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  return options;
}

template <typename Msg>
Msg ParseTyped(const std::string& payload, std::string_view what) {
  Msg        message;
  const auto status = google::protobuf::util::JsonStringToMessage(payload, &message, InboundParseOptions());
  if (!status.ok()) {
    throw ProtocolError("malformed " + std::string(what) + " payload: " + status.ToString());
  }
  return message;
}

std::string RequireString(const google::protobuf::Struct& header, const std::string& key) {
  const auto& fields = header.fields();
  const auto  it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue || it->second.string_value().empty()) {
    throw ProtocolError("missing mandatory field '" + key + "'");
  }
  return it->second.string_value();
}

uint32_t RequireHeaderId(const google::protobuf::Struct& header) {
  const auto& fields = header.fields();
  const auto  it     = fields.find("headerId");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    throw ProtocolError("missing mandatory field 'headerId'");
  }
  const double value = it->second.number_value();
  if (value < 0 || value > static_cast<double>(std::numeric_limits<uint32_t>::max()) || std::floor(value) != value) {
    throw ProtocolError("headerId is not an unsigned 32-bit integer");
  }
  return static_cast<uint32_t>(value);
}

bool IsKnownConnectionState(const std::string& state) {
  return state == "ONLINE" || state == "OFFLINE" || state == "CONNECTIONBROKEN";
}

} // namespace

ProtocolCodec::ProtocolCodec(CodecOptions options) : options_(std::move(options)) {
}

// ------------------------------------------------------------
// Inbound
// ------------------------------------------------------------

DecodedFrame ProtocolCodec::Decode(std::string_view topic, std::string_view payload) const {
  DecodedFrame frame;
  frame.topic = Topic::Parse(topic);

  const std::string        body(payload);
  google::protobuf::Struct header;
  if (!google::protobuf::util::JsonStringToMessage(body, &header).ok()) {
    throw ProtocolError("payload on '" + std::string(topic) + "' is not a JSON object");
  }

  frame.header_id         = RequireHeaderId(header);
  const auto timestamp    = RequireString(header, "timestamp");
  frame.version           = RequireString(header, "version");
  const auto manufacturer = RequireString(header, "manufacturer");
  const auto serial       = RequireString(header, "serialNumber");

  const auto message_time = util::ParseIso8601(timestamp);
  if (!message_time) {
    throw ProtocolError("timestamp is not ISO-8601: '" + timestamp + "'");
  }
  frame.message_time = *message_time;

  if (manufacturer != frame.topic.vehicle.manufacturer || serial != frame.topic.vehicle.serial_number) {
    throw ProtocolError("payload identity " + manufacturer + "/" + serial + " does not match topic '" + std::string(topic) + "'");
  }
  frame.vehicle_id = frame.topic.vehicle.Id();

  switch (frame.topic.kind) {
    case TopicKind::kState:
      frame.message = ParseTyped<fleetlink::v1::State>(body, "state");
      break;

    case TopicKind::kConnection: {
      auto connection = ParseTyped<fleetlink::v1::Connection>(body, "connection");
      if (!IsKnownConnectionState(connection.connection_state())) {
        throw ProtocolError("unknown connectionState '" + connection.connection_state() + "'");
      }
      frame.message = std::move(connection);
      break;
    }

    case TopicKind::kVisualization:
      frame.message = ParseTyped<fleetlink::v1::Visualization>(body, "visualization");
      break;

    default:
      frame.message = UnknownMessage{frame.topic.leaf};
      break;
  }

  return frame;
}

bool ProtocolCodec::Admit(const DecodedFrame& frame) {
  if (const auto* connection = std::get_if<fleetlink::v1::Connection>(&frame.message)) {
    if (connection->connection_state() == "ONLINE") {
      sequences_.Reset(frame.vehicle_id);
    }
  }
  return sequences_.Admit(frame.vehicle_id, frame.topic.kind, frame.header_id);
}

void ProtocolCodec::ResetSequences(const std::string& vehicle_id) {
  sequences_.Reset(vehicle_id);
}

fleetlink::v1::Order ProtocolCodec::DecodeOrder(std::string_view payload) const {
  return ParseTyped<fleetlink::v1::Order>(std::string(payload), "order");
}

std::vector<std::string> ProtocolCodec::Subscriptions() const {
  return FleetSubscriptions(options_.interface_name, options_.major_version);
}

// ------------------------------------------------------------
// Outbound
// ------------------------------------------------------------

// outbound_mutex_ held
uint32_t ProtocolCodec::NextHeaderId(const std::string& topic) {
  auto& next = header_ids_[topic];
  return next++;
}

EncodedMessage ProtocolCodec::EncodeOrder(fleetlink::v1::Order& order) {
  if (order.order_id().empty()) {
    throw ProtocolError("order without orderId");
  }
  if (order.manufacturer().empty() || order.serial_number().empty()) {
    throw ProtocolError("order without target vehicle");
  }

  EncodedMessage out;
  out.topic = Topic::For(options_.interface_name, options_.major_version, VehicleKey{order.manufacturer(), order.serial_number()}, TopicKind::kOrder)
                  .ToString();

  {
    std::lock_guard lock(outbound_mutex_);
    auto            it = order_update_ids_.find(order.order_id());
    if (it != order_update_ids_.end()) {
      order.set_order_update_id(std::max(order.order_update_id(), it->second + 1));
    }
    order_update_ids_[order.order_id()] = order.order_update_id();
    order.set_header_id(NextHeaderId(out.topic));
  }
  order.set_timestamp(util::ToIso8601(util::Now()));
  order.set_version(options_.version);

  if (!google::protobuf::util::MessageToJsonString(order, &out.payload, OutboundPrintOptions()).ok()) {
    throw ProtocolError("failed to encode order " + order.order_id());
  }
  return out;
}

EncodedMessage ProtocolCodec::EncodeInstantActions(const VehicleKey& vehicle, const std::vector<fleetlink::v1::Action>& actions) {
  fleetlink::v1::InstantActions message;
  message.set_manufacturer(vehicle.manufacturer);
  message.set_serial_number(vehicle.serial_number);
  for (const auto& action : actions) {
    *message.add_actions() = action;
  }

  EncodedMessage out;
  out.topic = Topic::For(options_.interface_name, options_.major_version, vehicle, TopicKind::kInstantActions).ToString();
  {
    std::lock_guard lock(outbound_mutex_);
    message.set_header_id(NextHeaderId(out.topic));
  }
  message.set_timestamp(util::ToIso8601(util::Now()));
  message.set_version(options_.version);

  if (!google::protobuf::util::MessageToJsonString(message, &out.payload, OutboundPrintOptions()).ok()) {
    throw ProtocolError("failed to encode instant actions for " + vehicle.Id());
  }
  return out;
}

} // namespace fleetlink::protocol
