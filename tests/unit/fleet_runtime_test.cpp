#include "internal/runtime/fleet_runtime.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/connection/connection_manager.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/credentials/secret_cipher.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/health/health_monitor.hpp"
#include "internal/pipeline/frame_pipeline.hpp"
#include "internal/service/fleet_service.hpp"
#include "internal/telemetry/telemetry_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/fakes/fake_broker_client.hpp"

namespace {

using namespace std::chrono_literals;
using fleetlink::health::HealthStatus;
using fleetlink::runtime::FleetRuntime;
using fleetlink::telemetry::LinkState;
using fleetlink::testing::FakeBrokerClient;

const std::string kStateTopic      = "uagv/v2/acme/agv-1/state";
const std::string kConnectionTopic = "uagv/v2/acme/agv-1/connection";

std::string Header(uint32_t header_id) {
  return R"("headerId": )" + std::to_string(header_id) +
         R"(, "timestamp": "2024-05-01T12:00:00Z", "version": "2.0.0", "manufacturer": "acme", "serialNumber": "agv-1")";
}

std::string StatePayload(uint32_t header_id, const std::string& order_id = "", uint32_t order_update_id = 0) {
  return "{" + Header(header_id) + R"(, "orderId": ")" + order_id + R"(", "orderUpdateId": )" + std::to_string(order_update_id) +
         R"(, "batteryState": {"batteryCharge": 64.0}, "agvPosition": {"x": 2.0, "y": 3.0, "theta": 0.1, "mapId": "hall"}})";
}

std::string ConnectionPayload(uint32_t header_id, const std::string& state) {
  return "{" + Header(header_id) + R"(, "connectionState": ")" + state + R"("})";
}

bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

struct Harness {
  std::shared_ptr<FakeBrokerClient>                        client = std::make_shared<FakeBrokerClient>();
  std::shared_ptr<fleetlink::credentials::CredentialStore> credentials;
  std::unique_ptr<FleetRuntime>                            runtime;

  explicit Harness(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "fleetlink_runtime_tests";
    std::filesystem::create_directories(dir);
    const auto db_path = dir / (name + ".db");
    std::filesystem::remove(db_path);

    auto db     = std::make_shared<fleetlink::db::sqlite::SqliteDB>(db_path.string());
    auto cipher = std::make_shared<fleetlink::credentials::SecretCipher>(fleetlink::credentials::SecretCipher::GenerateKey());
    credentials = std::make_shared<fleetlink::credentials::CredentialStore>(db, cipher);

    fleetlink::config::RuntimeOptions options;
    options.health.probe_interval = 20ms;
    options.health.backoff_base   = 10ms;
    options.health.backoff_max    = 50ms;
    runtime                       = std::make_unique<FleetRuntime>(options, credentials, client);
  }

  bool Healthy() const {
    return runtime->Health()->Status() == HealthStatus::kHealthy && client->IsConnected();
  }
};

void TestNothingConnectsBeforeAttach() {
  Harness h("lazy");
  std::this_thread::sleep_for(50ms);
  assert(h.client->ConnectCalls() == 0);
  assert(!h.runtime->Attached());

  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));
  assert(h.client->Subscriptions().size() == 3);
  assert(h.client->LastOptions()->host == "127.0.0.1");
}

void TestInboundFramesUpdateTelemetry() {
  Harness h("frames");
  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));

  h.client->Deliver(kStateTopic, StatePayload(1));
  h.client->Deliver(kStateTopic, StatePayload(1));        // replay
  h.client->Deliver(kStateTopic, "{\"headerId\": 2}");    // malformed
  h.client->Deliver("uagv/v2/acme/agv-1/factsheet", "{" + Header(1) + "}");

  const auto record = h.runtime->Telemetry()->Get("acme/agv-1");
  assert(record != nullptr);
  assert(record->has_state);
  assert(record->state.battery_state().battery_charge() == 64.0);
  assert(record->last_header_id == 1);
  assert(record->link_state == LinkState::kOnline);

  const auto counters = h.runtime->Pipeline()->Counters();
  assert(counters.accepted == 2);
  assert(counters.duplicate == 1);
  assert(counters.rejected == 1);
  assert(h.runtime->Telemetry()->Events("acme/agv-1").size() == 2);

  h.client->Deliver(kConnectionTopic, ConnectionPayload(1, "CONNECTIONBROKEN"));
  assert(h.runtime->Telemetry()->Get("acme/agv-1")->link_state == LinkState::kOffline);
  assert(h.runtime->Telemetry()->Get("acme/agv-1")->reported_connection == "CONNECTIONBROKEN");

  // rebooted vehicle: ONLINE resets the sequence so low header ids pass again
  h.client->Deliver(kConnectionTopic, ConnectionPayload(0, "ONLINE"));
  h.client->Deliver(kStateTopic, StatePayload(0));
  assert(h.runtime->Pipeline()->Counters().accepted == 5);
  assert(h.runtime->Telemetry()->Get("acme/agv-1")->link_state == LinkState::kOnline);
}

void TestBrokerLossReconnectsAndResubscribes() {
  Harness h("reconnect");
  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));
  const auto first_session = h.runtime->Connection()->Session().session_id;

  h.client->FailNextConnects(2);
  h.client->Drop("broker restarted");

  assert(WaitFor([&] { return h.Healthy() && h.client->ConnectCalls() >= 4; }));
  assert(h.runtime->Connection()->Session().session_id == first_session + 1);
  assert(h.client->Subscriptions().size() == 3);
}

void TestIdleSessionIsReaped() {
  Harness h("idle");
  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));
  h.client->Deliver(kStateTopic, StatePayload(1));

  assert(!h.runtime->ReapIdle(fleetlink::util::Now()));
  assert(h.runtime->ReapIdle(fleetlink::util::Now() + 2h));
  assert(!h.runtime->Attached());
  assert(!h.client->IsConnected());
  assert(h.runtime->Connection()->State() == fleetlink::connection::SessionState::kDisconnected);

  // cached telemetry survives the teardown
  assert(h.runtime->Telemetry()->Get("acme/agv-1") != nullptr);

  const auto calls = h.client->ConnectCalls();
  std::this_thread::sleep_for(60ms);
  assert(h.client->ConnectCalls() == calls);

  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));
}

void TestReapRacingAttachKeepsSupervisor() {
  Harness h("reap_race");
  for (int i = 0; i < 300; ++i) {
    std::thread reaper([&] { h.runtime->ReapIdle(fleetlink::util::Now() + 2h); });
    std::thread client([&] { h.runtime->Attach(); });
    reaper.join();
    client.join();

    // whichever ran last decides; the supervisor must agree with it
    assert(h.runtime->Attached() == h.runtime->Health()->Running());
  }

  h.runtime->Attach();
  assert(h.runtime->Health()->Running());
  assert(WaitFor([&] { return h.Healthy(); }));

  const auto calls = h.client->ConnectCalls();
  h.client->Drop("broker restarted");
  assert(WaitFor([&] { return h.Healthy() && h.client->ConnectCalls() > calls; }));
}

void TestBrokerConfigUpdateReconnects() {
  Harness h("update");
  h.runtime->Attach();
  assert(WaitFor([&] { return h.Healthy(); }));

  fleetlink::credentials::BrokerConfig config;
  config.host     = "new.broker";
  config.port     = 8883;
  config.username = "fleet";
  config.password = "pw";
  h.runtime->UpdateBrokerConfig(config);

  assert(h.credentials->Get().host == "new.broker");
  assert(WaitFor([&] { return h.Healthy() && h.client->LastOptions()->host == "new.broker"; }));
  assert(h.client->LastOptions()->port == 8883);
  assert(h.runtime->Connection()->Session().broker_url == "mqtt://new.broker:8883");
}

void TestServiceEndToEnd() {
  Harness                       h("service");
  fleetlink::service::FleetService service(fleetlink::service::ServiceContext{std::shared_ptr<FleetRuntime>(h.runtime.get(), [](FleetRuntime*) {})});

  // first call attaches
  (void)service.GetHealth({});
  assert(WaitFor([&] { return h.Healthy(); }));

  h.client->Deliver(kStateTopic, StatePayload(1));

  const auto vehicles = service.ListVehicles({});
  assert(vehicles.vehicles_size() == 1);
  assert(vehicles.vehicles(0).vehicle_id() == "acme/agv-1");
  assert(vehicles.vehicles(0).link_state() == fleetlink::v1::LINK_STATE_ONLINE);
  assert(vehicles.vehicles(0).map_id() == "hall");

  fleetlink::v1::GetVehicleRequest missing;
  missing.set_vehicle_id("acme/agv-9");
  bool not_found = false;
  try {
    (void)service.GetVehicle(missing);
  } catch (const fleetlink::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  fleetlink::v1::DispatchMissionRequest dispatch;
  dispatch.set_vehicle_id("acme/agv-1");
  dispatch.set_order_id("ORDER-E2E");
  dispatch.set_nodes_text("a,0,0,0\nb,3,0,1.57\nc,3,3,3.14\n");
  const auto mission = service.DispatchMission(dispatch);
  assert(mission.ack_state() == fleetlink::v1::ACK_STATE_PENDING);
  assert(mission.nodes_size() == 3);
  assert(mission.nodes(0).map_id() == "map");
  assert(mission.edges_size() == 2);

  h.client->Deliver(kStateTopic, StatePayload(2, "ORDER-E2E", 0));

  fleetlink::v1::GetMissionRequest get;
  get.set_order_id("ORDER-E2E");
  assert(service.GetMission(get).ack_state() == fleetlink::v1::ACK_STATE_ACKED);
  assert(service.ListMissions({}).missions_size() == 1);

  fleetlink::v1::ListEventsRequest events;
  events.set_vehicle_id("acme/agv-1");
  events.set_topic("state");
  assert(service.ListEvents(events).events_size() == 2);
  events.set_topic("bogus");
  bool bad_topic = false;
  try {
    (void)service.ListEvents(events);
  } catch (const fleetlink::util::ProtocolError&) {
    bad_topic = true;
  }
  assert(bad_topic);

  fleetlink::v1::SendInstantActionRequest pause;
  pause.set_vehicle_id("acme/agv-1");
  pause.set_action(fleetlink::v1::INSTANT_ACTION_TYPE_START_PAUSE);
  assert(!service.SendInstantAction(pause).action_id().empty());
  pause.set_action(fleetlink::v1::INSTANT_ACTION_TYPE_UNSPECIFIED);
  bool bad_action = false;
  try {
    (void)service.SendInstantAction(pause);
  } catch (const fleetlink::util::MissionError&) {
    bad_action = true;
  }
  assert(bad_action);

  const auto health = service.GetHealth({});
  assert(health.status() == fleetlink::v1::HEALTH_STATUS_HEALTHY);
  assert(health.session_state() == fleetlink::v1::SESSION_STATE_CONNECTED);
  assert(health.vehicles_online() == 1);
}

void TestServiceBrokerUpdateKeepsPassword() {
  Harness                       h("service_update");
  fleetlink::service::FleetService service(fleetlink::service::ServiceContext{std::shared_ptr<FleetRuntime>(h.runtime.get(), [](FleetRuntime*) {})});

  fleetlink::v1::UpdateBrokerConfigRequest req;
  req.set_host("first.broker");
  req.set_username("fleet");
  req.set_password("pw");
  service.UpdateBrokerConfig(req);

  req.set_host("second.broker");
  req.set_password("");
  service.UpdateBrokerConfig(req);

  const auto stored = h.credentials->Get();
  assert(stored.host == "second.broker");
  assert(stored.username == "fleet");
  assert(stored.password == "pw");

  req.set_host("");
  bool rejected = false;
  try {
    service.UpdateBrokerConfig(req);
  } catch (const fleetlink::util::ConfigError&) {
    rejected = true;
  }
  assert(rejected);
  assert(h.credentials->Get().host == "second.broker");

  assert(WaitFor([&] { return h.Healthy() && h.client->LastOptions()->host == "second.broker"; }));
}

} // namespace

int main() {
  TestNothingConnectsBeforeAttach();
  TestInboundFramesUpdateTelemetry();
  TestBrokerLossReconnectsAndResubscribes();
  TestIdleSessionIsReaped();
  TestReapRacingAttachKeepsSupervisor();
  TestBrokerConfigUpdateReconnects();
  TestServiceEndToEnd();
  TestServiceBrokerUpdateKeepsPassword();

  std::cout << "fleetlink_unit_fleet_runtime: pass\n";
  return 0;
}
