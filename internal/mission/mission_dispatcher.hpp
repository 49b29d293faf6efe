#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fleetlink/v1/vda5050.pb.h"
#include "internal/util/time.hpp"

namespace fleetlink::protocol {
class ProtocolCodec;
}
namespace fleetlink::connection {
class ConnectionManager;
}
namespace fleetlink::telemetry {
class TelemetryStore;
}

namespace fleetlink::mission {

enum class AckState {
  kPending,
  kAcked,
  kFailed,
  kTimeout,
};

std::string_view ToString(AckState state);

enum class InstantAction {
  kStartPause,
  kStopPause,
  kCancelOrder,
};

std::string_view ActionType(InstantAction action);

struct MissionOrder {
  std::string                      order_id;
  uint32_t                         order_update_id = 0;
  std::string                      vehicle_id;
  std::vector<fleetlink::v1::Node> nodes;
  std::vector<fleetlink::v1::Edge> edges;
  util::TimePoint                  dispatched_at;
  util::TimePoint                  ack_deadline;
  AckState                         ack_state = AckState::kPending;
  std::string                      detail;
};

struct MissionRequest {
  std::string                              vehicle_id;
  std::string                              order_id; // generated when empty
  std::vector<fleetlink::v1::Node>         nodes;
  std::vector<fleetlink::v1::Edge>         edges; // derived between consecutive nodes when empty
  std::optional<std::chrono::milliseconds> ack_timeout;
};

struct DispatcherOptions {
  std::chrono::milliseconds ack_timeout{30'000};
  std::string               order_prefix{"ORDER"};
  std::size_t               max_nodes     = 100;
  std::size_t               history_limit = 500;
};

/*
  Mission orders and their acknowledgement tracking.

  Dispatch():
    1. validates the route and the target vehicle (util::MissionError)
    2. fails fast with util::PublishError unless the session is CONNECTED
    3. records the order PENDING, then publishes; a failed publish removes
       the record again and rethrows

  OnState() correlates vehicle state with pending orders:
    - same orderId and orderUpdateId >= dispatched one   -> ACKED
    - orderError / orderUpdateError / noRouteError whose
      errorReferences name the orderId                    -> FAILED

  ExpireOverdue() turns PENDING orders past their deadline into TIMEOUT,
  exactly once. Orders are never redispatched automatically. Terminal orders
  are kept up to history_limit, oldest dropped first.
*/
class MissionDispatcher {
 public:
  using OutcomeListener = std::function<void(const MissionOrder&)>;

  MissionDispatcher(std::shared_ptr<protocol::ProtocolCodec> codec, std::shared_ptr<connection::ConnectionManager> connection,
                    std::shared_ptr<telemetry::TelemetryStore> telemetry, DispatcherOptions options);

  MissionOrder Dispatch(MissionRequest request);
  MissionOrder Dispatch(MissionRequest request, util::TimePoint now);

  // Publishes one instant action; returns its actionId.
  std::string SendInstantAction(const std::string& vehicle_id, InstantAction action);

  void OnState(const std::string& vehicle_id, const fleetlink::v1::State& state);

  // Returns the orders that timed out during this call.
  std::vector<MissionOrder> ExpireOverdue(util::TimePoint now);

  // Throws util::NotFound.
  MissionOrder              Get(const std::string& order_id) const;
  std::vector<MissionOrder> List() const;

  void SetOutcomeListener(OutcomeListener listener);

 private:
  // mutex_ held
  void Settle(MissionOrder& order, AckState state, std::string detail, std::vector<MissionOrder>* settled);
  void TrimHistory();

  void Notify(const std::vector<MissionOrder>& settled);

  std::shared_ptr<protocol::ProtocolCodec>       codec_;
  std::shared_ptr<connection::ConnectionManager> connection_;
  std::shared_ptr<telemetry::TelemetryStore>     telemetry_;
  DispatcherOptions                              options_;

  mutable std::mutex                  mutex_;
  std::map<std::string, MissionOrder> orders_;
  std::deque<std::string>             terminal_;

  std::mutex      listener_mutex_;
  OutcomeListener listener_;
};

} // namespace fleetlink::mission
