#include "internal/telemetry/telemetry_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using fleetlink::protocol::TopicKind;
using fleetlink::telemetry::LinkState;
using fleetlink::telemetry::TelemetryEvent;
using fleetlink::telemetry::TelemetryStore;
using fleetlink::telemetry::TelemetryWindow;
using fleetlink::telemetry::VehicleRecord;
using fleetlink::util::TimePoint;

const TimePoint kT0 = TimePoint{} + std::chrono::hours(24 * 365 * 50);

VehicleRecord Record(const std::string& vehicle_id, double battery) {
  VehicleRecord record;
  record.vehicle_id = vehicle_id;
  record.state.mutable_battery_state()->set_battery_charge(battery);
  record.has_state = true;
  return record;
}

void TestWindowEvictsOldest() {
  TelemetryWindow<int> window(3);
  for (int i = 0; i < 5; ++i) window.Push(i);
  const auto items = window.Items();
  assert(items.size() == 3);
  assert(items.front() == 2);
  assert(items.back() == 4);
  assert(window.Evicted() == 2);
}

void TestEventWindowStaysBounded() {
  TelemetryStore store;
  for (uint32_t i = 0; i < 10'000; ++i) {
    store.AppendEvent("acme/agv-1", TelemetryEvent{TopicKind::kState, i, kT0 + std::chrono::milliseconds(i), "{}"});
  }

  const auto events = store.Events("acme/agv-1", TopicKind::kState);
  assert(events.size() == 100);
  assert(events.front().header_id == 9'900);
  assert(events.back().header_id == 9'999);
  assert(store.Events("acme/agv-1", TopicKind::kVisualization).empty());
  assert(store.Events("acme/unknown").empty());
}

void TestEventsMergedByArrival() {
  TelemetryStore store;
  store.AppendEvent("acme/agv-1", TelemetryEvent{TopicKind::kState, 1, kT0 + 1ms, "s1"});
  store.AppendEvent("acme/agv-1", TelemetryEvent{TopicKind::kVisualization, 1, kT0 + 2ms, "v1"});
  store.AppendEvent("acme/agv-1", TelemetryEvent{TopicKind::kState, 2, kT0 + 3ms, "s2"});

  const auto all = store.Events("acme/agv-1");
  assert(all.size() == 3);
  assert(all[0].payload == "s1");
  assert(all[1].payload == "v1");
  assert(all[2].payload == "s2");
}

void TestUpsertAndMerge() {
  TelemetryStore store;
  assert(store.Get("acme/agv-1") == nullptr);

  store.Upsert(Record("acme/agv-1", 90), kT0);
  auto record = store.Get("acme/agv-1");
  assert(record != nullptr);
  assert(record->link_state == LinkState::kOnline);
  assert(record->last_seen_at == kT0);
  assert(record->state.battery_state().battery_charge() == 90);

  store.Merge("acme/agv-1", kT0 + 1s, [](VehicleRecord& r) { r.reported_connection = "ONLINE"; });
  record = store.Get("acme/agv-1");
  assert(record->reported_connection == "ONLINE");
  assert(record->state.battery_state().battery_charge() == 90);
  assert(record->last_seen_at == kT0 + 1s);
  assert(store.FreshestArrival() == kT0 + 1s);
  assert(store.VehicleCount() == 1);
}

void TestSilentVehiclesAreDemotedNotRemoved() {
  TelemetryStore store;
  store.Upsert(Record("acme/agv-1", 50), kT0);
  store.Upsert(Record("acme/agv-2", 50), kT0 + 50s);

  assert(store.EvictStale(kT0 + 59s) == 0);

  assert(store.EvictStale(kT0 + 61s) == 1);
  assert(store.Get("acme/agv-1")->link_state == LinkState::kStale);
  assert(store.Get("acme/agv-2")->link_state == LinkState::kOnline);

  assert(store.EvictStale(kT0 + 121s) == 2);
  assert(store.Get("acme/agv-1")->link_state == LinkState::kOffline);
  assert(store.Get("acme/agv-2")->link_state == LinkState::kStale);

  const auto counts = store.Counts();
  assert(counts.online == 0);
  assert(counts.stale == 1);
  assert(counts.offline == 1);
  assert(store.VehicleCount() == 2);

  // fresh traffic revives
  store.Merge("acme/agv-1", kT0 + 130s, [](VehicleRecord&) {});
  assert(store.Get("acme/agv-1")->link_state == LinkState::kOnline);
}

void TestReportedOfflineKeepsLastSeen() {
  TelemetryStore store;
  store.Upsert(Record("acme/agv-1", 50), kT0);
  store.MarkOffline("acme/agv-1");
  const auto record = store.Get("acme/agv-1");
  assert(record->link_state == LinkState::kOffline);
  assert(record->last_seen_at == kT0);
  store.MarkOffline("acme/missing");
  assert(store.VehicleCount() == 1);
}

void TestReadersSeeWholeRecords() {
  TelemetryStore   store;
  std::atomic_bool done{false};

  std::thread writer([&] {
    for (int i = 0; i < 5'000; ++i) {
      const double value = static_cast<double>(i);
      store.Merge("acme/agv-1", kT0 + std::chrono::milliseconds(i), [value](VehicleRecord& r) {
        r.state.mutable_battery_state()->set_battery_charge(value);
        r.state.mutable_agv_position()->set_x(value);
      });
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!done) {
        const auto snapshot = store.SnapshotAll();
        for (const auto& [id, record] : *snapshot) {
          assert(record->state.battery_state().battery_charge() == record->state.agv_position().x());
        }
      }
    });
  }

  writer.join();
  for (auto& reader : readers) reader.join();
  assert(store.Get("acme/agv-1")->state.agv_position().x() == 4'999);
}

} // namespace

int main() {
  TestWindowEvictsOldest();
  TestEventWindowStaysBounded();
  TestEventsMergedByArrival();
  TestUpsertAndMerge();
  TestSilentVehiclesAreDemotedNotRemoved();
  TestReportedOfflineKeepsLastSeen();
  TestReadersSeeWholeRecords();

  std::cout << "fleetlink_unit_telemetry_store: pass\n";
  return 0;
}
