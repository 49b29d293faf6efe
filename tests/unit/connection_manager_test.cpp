#include "internal/connection/connection_manager.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/fakes/fake_broker_client.hpp"

namespace {

using fleetlink::connection::ConnectionManager;
using fleetlink::connection::ConnectionOptions;
using fleetlink::connection::SessionGuard;
using fleetlink::connection::SessionState;
using fleetlink::credentials::BrokerConfig;
using fleetlink::testing::FakeBrokerClient;
using fleetlink::util::ConnectionError;
using fleetlink::util::PublishError;

ConnectionOptions Options() {
  ConnectionOptions options;
  options.subscriptions = {"uagv/v2/+/+/state", "uagv/v2/+/+/connection"};
  return options;
}

BrokerConfig Broker() {
  BrokerConfig config;
  config.host     = "broker.local";
  config.port     = 1883;
  config.username = "fleet";
  config.password = "pw";
  return config;
}

bool Contains(const std::vector<std::string>& topics, const std::string& topic) {
  return std::find(topics.begin(), topics.end(), topic) != topics.end();
}

void TestConnectSubscribesFleetTopics() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());
  assert(manager.State() == SessionState::kDisconnected);

  manager.Connect(Broker());
  assert(manager.State() == SessionState::kConnected);

  const auto session = manager.Session();
  assert(session.session_id == 1);
  assert(session.broker_url == "mqtt://broker.local:1883");
  assert(session.client_id.rfind("fleetlink-", 0) == 0);
  assert(session.connected_at.has_value());

  const auto opts = client->LastOptions();
  assert(opts->username == "fleet");
  assert(opts->password == "pw");

  const auto subs = client->Subscriptions();
  assert(subs.size() == 2);
  assert(Contains(subs, "uagv/v2/+/+/state"));
}

void TestFailedConnectLeavesDisconnected() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());
  client->FailNextConnects(1, ConnectionError::Kind::kAuth);

  bool threw = false;
  try {
    manager.Connect(Broker());
  } catch (const ConnectionError& e) {
    threw = e.kind() == ConnectionError::Kind::kAuth;
  }
  assert(threw);
  assert(manager.State() == SessionState::kDisconnected);
  assert(manager.Session().last_error == "scripted connect failure");
}

void TestReconnectRestoresEverySubscription() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());
  manager.Connect(Broker());
  manager.Subscribe("uagv/v2/acme/agv-1/factsheet");
  assert(client->Subscriptions().size() == 3);

  client->Drop("keepalive timeout");
  assert(manager.State() == SessionState::kDisconnected);
  assert(manager.Session().last_error == "keepalive timeout");
  assert(client->Subscriptions().empty());

  manager.Connect(Broker());
  const auto subs = client->Subscriptions();
  assert(subs.size() == 3);
  assert(Contains(subs, "uagv/v2/acme/agv-1/factsheet"));
  assert(manager.Session().session_id == 2);
}

void TestPublishRequiresConnectedSession() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());

  bool threw = false;
  try {
    manager.Publish("uagv/v2/acme/agv-1/order", "{}");
  } catch (const PublishError&) {
    threw = true;
  }
  assert(threw);
  assert(client->Published().empty());

  manager.Connect(Broker());
  manager.Publish("uagv/v2/acme/agv-1/order", "{}");
  assert(client->Published().size() == 1);
  assert(client->Published().front().qos == 1);

  manager.MarkHeartbeatMissed();
  assert(manager.State() == SessionState::kDegraded);
  threw = false;
  try {
    manager.Publish("uagv/v2/acme/agv-1/order", "{}");
  } catch (const PublishError&) {
    threw = true;
  }
  assert(threw);

  manager.MarkHeartbeatOk();
  assert(manager.State() == SessionState::kConnected);
}

void TestInboundFramesReachHandler() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());

  std::vector<std::string> seen;
  manager.SetFrameHandler([&](const std::string& topic, const std::string& payload, fleetlink::util::TimePoint) { seen.push_back(topic + "=" + payload); });
  manager.Connect(Broker());
  assert(!manager.LastInboundAt().has_value());

  client->Deliver("uagv/v2/acme/agv-1/state", "{}");
  assert(seen.size() == 1);
  assert(seen.front() == "uagv/v2/acme/agv-1/state={}");
  assert(manager.LastInboundAt().has_value());

  // a throwing handler never reaches the network thread
  manager.SetFrameHandler([](const std::string&, const std::string&, fleetlink::util::TimePoint) { throw std::runtime_error("boom"); });
  client->Deliver("uagv/v2/acme/agv-1/state", "{}");
}

void TestSessionGuardReleasesOnScopeExit() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());
  {
    SessionGuard guard(manager, Broker());
    assert(manager.IsConnected());
  }
  assert(manager.State() == SessionState::kDisconnected);
  assert(!client->IsConnected());
}

void TestRecordHealthCheck() {
  auto              client = std::make_shared<FakeBrokerClient>();
  ConnectionManager manager(client, Options());
  const auto        now = fleetlink::util::Now();
  manager.RecordHealthCheck(now, 2);
  const auto session = manager.Session();
  assert(session.last_health_check_at == now);
  assert(session.reconnect_attempts == 2);
}

} // namespace

int main() {
  TestConnectSubscribesFleetTopics();
  TestFailedConnectLeavesDisconnected();
  TestReconnectRestoresEverySubscription();
  TestPublishRequiresConnectedSession();
  TestInboundFramesReachHandler();
  TestSessionGuardReleasesOnScopeExit();
  TestRecordHealthCheck();

  std::cout << "fleetlink_unit_connection_manager: pass\n";
  return 0;
}
