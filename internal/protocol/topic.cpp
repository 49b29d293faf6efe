#include "topic.hpp"

#include "internal/util/errors.hpp"

namespace fleetlink::protocol {

using fleetlink::util::ProtocolError;

namespace {

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  size_t                        start = 0;
  while (true) {
    const size_t pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

} // namespace

std::string_view ToString(TopicKind kind) {
  switch (kind) {
    case TopicKind::kOrder:
      return "order";
    case TopicKind::kInstantActions:
      return "instantActions";
    case TopicKind::kState:
      return "state";
    case TopicKind::kConnection:
      return "connection";
    case TopicKind::kVisualization:
      return "visualization";
    case TopicKind::kFactsheet:
      return "factsheet";
    case TopicKind::kUnknown:
      break;
  }
  return "unknown";
}

TopicKind ParseTopicKind(std::string_view leaf) {
  if (leaf == "order") return TopicKind::kOrder;
  if (leaf == "instantActions") return TopicKind::kInstantActions;
  if (leaf == "state") return TopicKind::kState;
  if (leaf == "connection") return TopicKind::kConnection;
  if (leaf == "visualization") return TopicKind::kVisualization;
  if (leaf == "factsheet") return TopicKind::kFactsheet;
  return TopicKind::kUnknown;
}

std::string VehicleKey::Id() const {
  return manufacturer + "/" + serial_number;
}

VehicleKey VehicleKey::FromId(const std::string& vehicle_id) {
  const auto pos = vehicle_id.find('/');
  if (pos == std::string::npos || pos == 0 || pos + 1 == vehicle_id.size() || vehicle_id.find('/', pos + 1) != std::string::npos) {
    throw ProtocolError("vehicle id must be <manufacturer>/<serialNumber>: '" + vehicle_id + "'");
  }
  return VehicleKey{vehicle_id.substr(0, pos), vehicle_id.substr(pos + 1)};
}

Topic Topic::Parse(std::string_view text) {
  const auto parts = Split(text, '/');
  if (parts.size() != 4 && parts.size() != 5) {
    throw ProtocolError("unexpected topic layout: '" + std::string(text) + "'");
  }
  for (const auto& part : parts) {
    if (part.empty()) {
      throw ProtocolError("empty topic segment: '" + std::string(text) + "'");
    }
  }

  Topic  topic;
  size_t i             = 0;
  topic.interface_name = std::string(parts[i++]);
  if (parts.size() == 5) {
    topic.major_version = std::string(parts[i++]);
  }
  topic.vehicle.manufacturer  = std::string(parts[i++]);
  topic.vehicle.serial_number = std::string(parts[i++]);
  topic.leaf                  = std::string(parts[i]);
  topic.kind                  = ParseTopicKind(topic.leaf);
  return topic;
}

Topic Topic::For(const std::string& interface_name, const std::string& major_version, const VehicleKey& vehicle, TopicKind kind) {
  Topic topic;
  topic.interface_name = interface_name;
  topic.major_version  = major_version;
  topic.vehicle        = vehicle;
  topic.leaf           = std::string(protocol::ToString(kind));
  topic.kind           = kind;
  return topic;
}

std::string Topic::ToString() const {
  std::string out = interface_name;
  if (!major_version.empty()) {
    out += "/" + major_version;
  }
  out += "/" + vehicle.manufacturer + "/" + vehicle.serial_number + "/" + leaf;
  return out;
}

std::vector<std::string> FleetSubscriptions(const std::string& interface_name, const std::string& major_version) {
  std::string prefix = interface_name;
  if (!major_version.empty()) {
    prefix += "/" + major_version;
  }
  return {prefix + "/+/+/state", prefix + "/+/+/connection", prefix + "/+/+/visualization"};
}

} // namespace fleetlink::protocol
