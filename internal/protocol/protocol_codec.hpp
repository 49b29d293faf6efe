#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "fleetlink/v1/vda5050.pb.h"
#include "internal/util/time.hpp"
#include "sequence_tracker.hpp"
#include "topic.hpp"

namespace fleetlink::protocol {

// Payload on a topic the fleet link does not interpret (factsheet, foreign leaves).
struct UnknownMessage {
  std::string leaf;
};

using Message = std::variant<fleetlink::v1::State, fleetlink::v1::Connection, fleetlink::v1::Visualization, UnknownMessage>;

struct DecodedFrame {
  Topic           topic;
  std::string     vehicle_id;
  uint32_t        header_id = 0;
  util::TimePoint message_time;
  std::string     version;
  Message         message;
};

struct EncodedMessage {
  std::string topic;
  std::string payload;
};

struct CodecOptions {
  std::string interface_name{"uagv"};
  std::string major_version{"v2"};
  std::string version{"2.0.0"};
};

/*
  VDA5050 framing.

  Decode():
    - topic and JSON payload are parsed, unknown JSON fields ignored
    - headerId, timestamp, version, manufacturer and serialNumber are
      mandatory; the payload identity must match the topic
    - throws util::ProtocolError; the caller drops the single message

  Admit() applies the sequencing rule: a headerId at or below the last
  accepted one for that vehicle and topic is discarded. A connection message
  reporting ONLINE is a full resync and resets every baseline of the vehicle
  before being admitted.

  Encode*() fill the outbound header (per-topic headerId counter, UTC
  timestamp, protocol version).
*/
class ProtocolCodec {
 public:
  explicit ProtocolCodec(CodecOptions options = {});

  DecodedFrame Decode(std::string_view topic, std::string_view payload) const;

  bool Admit(const DecodedFrame& frame);
  void ResetSequences(const std::string& vehicle_id);

  // Assigns order_update_id (monotonic per orderId) and the header fields in place.
  EncodedMessage EncodeOrder(fleetlink::v1::Order& order);

  EncodedMessage EncodeInstantActions(const VehicleKey& vehicle, const std::vector<fleetlink::v1::Action>& actions);

  fleetlink::v1::Order DecodeOrder(std::string_view payload) const;

  std::vector<std::string> Subscriptions() const;

  const CodecOptions& Options() const {
    return options_;
  }

 private:
  uint32_t NextHeaderId(const std::string& topic);

  CodecOptions    options_;
  SequenceTracker sequences_;

  std::mutex                      outbound_mutex_;
  std::map<std::string, uint32_t> header_ids_;
  std::map<std::string, uint32_t> order_update_ids_;
};

} // namespace fleetlink::protocol
