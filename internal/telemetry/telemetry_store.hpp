#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fleetlink/v1/vda5050.pb.h"
#include "internal/protocol/topic.hpp"
#include "internal/util/time.hpp"
#include "telemetry_window.hpp"

namespace fleetlink::telemetry {

enum class LinkState {
  kOnline,
  kStale,
  kOffline,
};

std::string_view ToString(LinkState state);

/*
  Latest known picture of one vehicle.

  last_seen_at is the arrival time at this process, never the timestamp the
  vehicle embedded in its message (message_time).
*/
struct VehicleRecord {
  std::string vehicle_id;
  std::string manufacturer;
  std::string serial_number;

  fleetlink::v1::State state;
  bool                 has_state = false;

  // Last "connectionState" reported on the connection topic.
  std::string reported_connection;

  uint32_t        last_header_id = 0;
  util::TimePoint message_time;
  util::TimePoint last_seen_at;
  LinkState       link_state = LinkState::kOnline;
};

struct TelemetryEvent {
  protocol::TopicKind kind      = protocol::TopicKind::kUnknown;
  uint32_t            header_id = 0;
  util::TimePoint     arrived_at;
  std::string         payload;
};

struct TelemetryOptions {
  std::size_t               window_capacity = 100;
  std::chrono::milliseconds stale_after{60'000};
  std::chrono::milliseconds offline_after{120'000};
};

struct LinkStateCounts {
  uint32_t online  = 0;
  uint32_t stale   = 0;
  uint32_t offline = 0;
};

/*
  Per-vehicle cache of latest state plus capped recent-event windows.

  Records:
    - copy-on-write map published through an atomic shared_ptr
    - Snapshot()/Get() never take a lock and always see complete records
    - writers (decode pipeline, health probe) serialize on write_mutex_
    - records are demoted to STALE / OFFLINE, never removed

  Event windows:
    - one TelemetryWindow per (vehicle, topic kind) under a shared_mutex
*/
class TelemetryStore {
 public:
  using RecordPtr = std::shared_ptr<const VehicleRecord>;
  using Snapshot  = std::map<std::string, RecordPtr>;
  using Mutator   = std::function<void(VehicleRecord&)>;

  explicit TelemetryStore(TelemetryOptions options = {});

  // Replaces the record for record.vehicle_id; marks it ONLINE as of arrived_at.
  void Upsert(VehicleRecord record, util::TimePoint arrived_at);

  // Read-modify-write of one record (created empty when absent), same arrival semantics as Upsert.
  void Merge(const std::string& vehicle_id, util::TimePoint arrived_at, const Mutator& mutate);

  // As above, but the record is published with `link_state` in the same write.
  void Merge(const std::string& vehicle_id, util::TimePoint arrived_at, LinkState link_state, const Mutator& mutate);

  // Demotes without touching last_seen_at (vehicle reported OFFLINE / CONNECTIONBROKEN).
  void MarkOffline(const std::string& vehicle_id);

  // Returns the number of records whose link state changed.
  std::size_t EvictStale(util::TimePoint now);

  void AppendEvent(const std::string& vehicle_id, TelemetryEvent event);

  std::shared_ptr<const Snapshot> SnapshotAll() const;
  RecordPtr                       Get(const std::string& vehicle_id) const;

  // Oldest first. kUnknown selects every topic of the vehicle, merged by arrival.
  std::vector<TelemetryEvent> Events(const std::string& vehicle_id, protocol::TopicKind kind = protocol::TopicKind::kUnknown) const;

  std::optional<util::TimePoint> FreshestArrival() const;
  LinkStateCounts                Counts() const;
  std::size_t                    VehicleCount() const;

  const TelemetryOptions& Options() const {
    return options_;
  }

 private:
  using VehicleWindows = std::map<protocol::TopicKind, TelemetryWindow<TelemetryEvent>>;

  // write_mutex_ held
  void Publish(std::shared_ptr<const Snapshot> next);
  void NoteArrival(util::TimePoint arrived_at);

  TelemetryOptions options_;

  std::mutex                                   write_mutex_;
  std::atomic<std::shared_ptr<const Snapshot>> records_;
  std::atomic<int64_t>                         freshest_arrival_ms_{0};

  mutable std::shared_mutex                       windows_mutex_;
  std::unordered_map<std::string, VehicleWindows> windows_;
};

} // namespace fleetlink::telemetry
