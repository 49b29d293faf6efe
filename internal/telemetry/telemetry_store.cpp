#include "telemetry_store.hpp"

#include <algorithm>

namespace fleetlink::telemetry {

std::string_view ToString(LinkState state) {
  switch (state) {
    case LinkState::kOnline:
      return "ONLINE";
    case LinkState::kStale:
      return "STALE";
    case LinkState::kOffline:
      return "OFFLINE";
  }
  return "UNKNOWN";
}

TelemetryStore::TelemetryStore(TelemetryOptions options) : options_(options), records_(std::make_shared<const Snapshot>()) {
  if (options_.window_capacity == 0) {
    options_.window_capacity = 100;
  }
  if (options_.offline_after < options_.stale_after) {
    options_.offline_after = options_.stale_after;
  }
}

// ------------------------------------------------------------
// Writers
// ------------------------------------------------------------

void TelemetryStore::Publish(std::shared_ptr<const Snapshot> next) {
  records_.store(std::move(next), std::memory_order_release);
}

void TelemetryStore::NoteArrival(util::TimePoint arrived_at) {
  const auto ms      = static_cast<int64_t>(util::ToUnixMillis(arrived_at));
  auto       current = freshest_arrival_ms_.load(std::memory_order_relaxed);
  while (ms > current && !freshest_arrival_ms_.compare_exchange_weak(current, ms, std::memory_order_relaxed)) {
  }
}

void TelemetryStore::Upsert(VehicleRecord record, util::TimePoint arrived_at) {
  record.last_seen_at = arrived_at;
  record.link_state   = LinkState::kOnline;

  const std::string vehicle_id = record.vehicle_id;

  std::lock_guard lock(write_mutex_);
  auto            next = std::make_shared<Snapshot>(*records_.load(std::memory_order_acquire));
  (*next)[vehicle_id]  = std::make_shared<const VehicleRecord>(std::move(record));
  Publish(std::move(next));
  NoteArrival(arrived_at);
}

void TelemetryStore::Merge(const std::string& vehicle_id, util::TimePoint arrived_at, const Mutator& mutate) {
  Merge(vehicle_id, arrived_at, LinkState::kOnline, mutate);
}

void TelemetryStore::Merge(const std::string& vehicle_id, util::TimePoint arrived_at, LinkState link_state, const Mutator& mutate) {
  std::lock_guard lock(write_mutex_);
  const auto      current = records_.load(std::memory_order_acquire);

  VehicleRecord record;
  auto          it = current->find(vehicle_id);
  if (it != current->end()) {
    record = *it->second;
  } else {
    record.vehicle_id = vehicle_id;
  }

  mutate(record);
  record.vehicle_id   = vehicle_id;
  record.last_seen_at = arrived_at;
  record.link_state   = link_state;

  auto next           = std::make_shared<Snapshot>(*current);
  (*next)[vehicle_id] = std::make_shared<const VehicleRecord>(std::move(record));
  Publish(std::move(next));
  NoteArrival(arrived_at);
}

void TelemetryStore::MarkOffline(const std::string& vehicle_id) {
  std::lock_guard lock(write_mutex_);
  const auto      current = records_.load(std::memory_order_acquire);
  auto            it      = current->find(vehicle_id);
  if (it == current->end() || it->second->link_state == LinkState::kOffline) {
    return;
  }

  auto record        = std::make_shared<VehicleRecord>(*it->second);
  record->link_state = LinkState::kOffline;

  auto next           = std::make_shared<Snapshot>(*current);
  (*next)[vehicle_id] = std::move(record);
  Publish(std::move(next));
}

std::size_t TelemetryStore::EvictStale(util::TimePoint now) {
  std::lock_guard lock(write_mutex_);
  const auto      current = records_.load(std::memory_order_acquire);

  std::shared_ptr<Snapshot> next;
  std::size_t               changed = 0;

  for (const auto& [vehicle_id, record] : *current) {
    const auto idle = now - record->last_seen_at;

    LinkState target = record->link_state;
    if (idle > options_.offline_after) {
      target = LinkState::kOffline;
    } else if (idle > options_.stale_after && record->link_state == LinkState::kOnline) {
      target = LinkState::kStale;
    }
    if (target == record->link_state) {
      continue;
    }

    if (!next) {
      next = std::make_shared<Snapshot>(*current);
    }
    auto demoted        = std::make_shared<VehicleRecord>(*record);
    demoted->link_state = target;
    (*next)[vehicle_id] = std::move(demoted);
    ++changed;
  }

  if (next) {
    Publish(std::move(next));
  }
  return changed;
}

void TelemetryStore::AppendEvent(const std::string& vehicle_id, TelemetryEvent event) {
  std::unique_lock lock(windows_mutex_);
  auto&            windows = windows_[vehicle_id];
  auto             it      = windows.find(event.kind);
  if (it == windows.end()) {
    it = windows.emplace(event.kind, TelemetryWindow<TelemetryEvent>(options_.window_capacity)).first;
  }
  it->second.Push(std::move(event));
}

// ------------------------------------------------------------
// Readers
// ------------------------------------------------------------

std::shared_ptr<const TelemetryStore::Snapshot> TelemetryStore::SnapshotAll() const {
  return records_.load(std::memory_order_acquire);
}

TelemetryStore::RecordPtr TelemetryStore::Get(const std::string& vehicle_id) const {
  const auto snapshot = records_.load(std::memory_order_acquire);
  auto       it       = snapshot->find(vehicle_id);
  if (it == snapshot->end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<TelemetryEvent> TelemetryStore::Events(const std::string& vehicle_id, protocol::TopicKind kind) const {
  std::shared_lock lock(windows_mutex_);
  auto             vehicle = windows_.find(vehicle_id);
  if (vehicle == windows_.end()) {
    return {};
  }

  if (kind != protocol::TopicKind::kUnknown) {
    auto it = vehicle->second.find(kind);
    return it == vehicle->second.end() ? std::vector<TelemetryEvent>{} : it->second.Items();
  }

  std::vector<TelemetryEvent> merged;
  for (const auto& [topic_kind, window] : vehicle->second) {
    auto items = window.Items();
    merged.insert(merged.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
  }
  std::stable_sort(merged.begin(), merged.end(), [](const TelemetryEvent& a, const TelemetryEvent& b) { return a.arrived_at < b.arrived_at; });
  return merged;
}

std::optional<util::TimePoint> TelemetryStore::FreshestArrival() const {
  const auto ms = freshest_arrival_ms_.load(std::memory_order_relaxed);
  if (ms == 0) {
    return std::nullopt;
  }
  return util::TimePoint{} + std::chrono::milliseconds(ms);
}

LinkStateCounts TelemetryStore::Counts() const {
  LinkStateCounts counts;
  for (const auto& [vehicle_id, record] : *records_.load(std::memory_order_acquire)) {
    switch (record->link_state) {
      case LinkState::kOnline:
        ++counts.online;
        break;
      case LinkState::kStale:
        ++counts.stale;
        break;
      case LinkState::kOffline:
        ++counts.offline;
        break;
    }
  }
  return counts;
}

std::size_t TelemetryStore::VehicleCount() const {
  return records_.load(std::memory_order_acquire)->size();
}

} // namespace fleetlink::telemetry
