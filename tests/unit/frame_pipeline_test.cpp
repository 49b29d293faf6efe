#include "internal/pipeline/frame_pipeline.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/protocol/protocol_codec.hpp"
#include "internal/telemetry/telemetry_store.hpp"

namespace {

using fleetlink::pipeline::FramePipeline;
using fleetlink::protocol::ProtocolCodec;
using fleetlink::telemetry::LinkState;
using fleetlink::telemetry::TelemetryStore;

const std::string kVehicle         = "acme/agv-3";
const std::string kStateTopic      = "uagv/v2/acme/agv-3/state";
const std::string kConnectionTopic = "uagv/v2/acme/agv-3/connection";

std::string Header(uint32_t header_id) {
  return R"("headerId": )" + std::to_string(header_id) +
         R"(, "timestamp": "2024-05-01T12:00:00Z", "version": "2.0.0", "manufacturer": "acme", "serialNumber": "agv-3")";
}

std::string StatePayload(uint32_t header_id) {
  return "{" + Header(header_id) + R"(, "batteryState": {"batteryCharge": 80.0}})";
}

std::string ConnectionPayload(uint32_t header_id, const std::string& state) {
  return "{" + Header(header_id) + R"(, "connectionState": ")" + state + R"("})";
}

struct Harness {
  std::shared_ptr<ProtocolCodec>  codec     = std::make_shared<ProtocolCodec>();
  std::shared_ptr<TelemetryStore> telemetry = std::make_shared<TelemetryStore>();
  FramePipeline                   pipeline{codec, telemetry, nullptr};
};

void TestCountersSplitByOutcome() {
  Harness    h;
  const auto now = fleetlink::util::Now();

  h.pipeline.Handle(kStateTopic, StatePayload(1), now);
  h.pipeline.Handle(kStateTopic, StatePayload(1), now);
  h.pipeline.Handle(kStateTopic, "not json", now);

  const auto counters = h.pipeline.Counters();
  assert(counters.accepted == 1);
  assert(counters.duplicate == 1);
  assert(counters.rejected == 1);
  assert(h.telemetry->Events(kVehicle).size() == 1);
}

void TestBrokenConnectionIsNeverPublishedOnline() {
  Harness    h;
  const auto now = fleetlink::util::Now();

  h.pipeline.Handle(kStateTopic, StatePayload(1), now);
  assert(h.telemetry->Get(kVehicle)->link_state == LinkState::kOnline);

  h.pipeline.Handle(kConnectionTopic, ConnectionPayload(1, "CONNECTIONBROKEN"), now);
  auto record = h.telemetry->Get(kVehicle);
  assert(record->link_state == LinkState::kOffline);
  assert(record->reported_connection == "CONNECTIONBROKEN");
  assert(record->has_state);

  std::atomic<bool> done{false};
  std::atomic<int>  seen_online{0};
  std::thread       reader([&] {
    while (!done) {
      if (h.telemetry->Get(kVehicle)->link_state == LinkState::kOnline) {
        ++seen_online;
      }
    }
  });

  for (uint32_t i = 2; i < 2000; ++i) {
    h.pipeline.Handle(kConnectionTopic, ConnectionPayload(i, i % 2 == 0 ? "OFFLINE" : "CONNECTIONBROKEN"), now);
  }
  done = true;
  reader.join();

  assert(seen_online == 0);
  assert(h.telemetry->Get(kVehicle)->link_state == LinkState::kOffline);
}

void TestOnlineReportRestoresVehicle() {
  Harness    h;
  const auto now = fleetlink::util::Now();

  h.pipeline.Handle(kConnectionTopic, ConnectionPayload(1, "OFFLINE"), now);
  assert(h.telemetry->Get(kVehicle)->link_state == LinkState::kOffline);

  h.pipeline.Handle(kConnectionTopic, ConnectionPayload(0, "ONLINE"), now);
  const auto record = h.telemetry->Get(kVehicle);
  assert(record->link_state == LinkState::kOnline);
  assert(record->reported_connection == "ONLINE");
}

} // namespace

int main() {
  TestCountersSplitByOutcome();
  TestBrokenConnectionIsNeverPublishedOnline();
  TestOnlineReportRestoresVehicle();

  std::cout << "fleetlink_unit_frame_pipeline: pass\n";
  return 0;
}
