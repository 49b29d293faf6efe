#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fleetlink::protocol {

enum class TopicKind {
  kOrder,
  kInstantActions,
  kState,
  kConnection,
  kVisualization,
  kFactsheet,
  kUnknown,
};

std::string_view ToString(TopicKind kind);
TopicKind        ParseTopicKind(std::string_view leaf);

/*
  Vehicle identity as carried in topics and message headers.
  The fleet-wide vehicle id is "<manufacturer>/<serialNumber>".
*/
struct VehicleKey {
  std::string manufacturer;
  std::string serial_number;

  std::string Id() const;

  // Splits "<manufacturer>/<serialNumber>"; throws util::ProtocolError otherwise.
  static VehicleKey FromId(const std::string& vehicle_id);

  bool operator==(const VehicleKey&) const = default;
};

/*
  VDA5050 topic:

      <interfaceName>/<majorVersion>/<manufacturer>/<serialNumber>/<leaf>
      <interfaceName>/<manufacturer>/<serialNumber>/<leaf>

  Both layouts are accepted on input; the message kind is the trailing
  segment.
*/
struct Topic {
  std::string interface_name;
  std::string major_version; // empty for the short layout
  VehicleKey  vehicle;
  std::string leaf;
  TopicKind   kind = TopicKind::kUnknown;

  // Throws util::ProtocolError on an empty segment or wrong segment count.
  static Topic Parse(std::string_view text);

  static Topic For(const std::string& interface_name, const std::string& major_version, const VehicleKey& vehicle, TopicKind kind);

  std::string ToString() const;
};

// Fixed inbound subscription set: state, connection and visualization of every vehicle.
std::vector<std::string> FleetSubscriptions(const std::string& interface_name, const std::string& major_version);

} // namespace fleetlink::protocol
