#include "internal/health/health_monitor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/connection/connection_manager.hpp"
#include "internal/health/backoff_policy.hpp"
#include "internal/util/errors.hpp"
#include "tests/fakes/fake_broker_client.hpp"

namespace {

using namespace std::chrono_literals;
using fleetlink::connection::ConnectionManager;
using fleetlink::connection::ConnectionOptions;
using fleetlink::connection::SessionState;
using fleetlink::credentials::BrokerConfig;
using fleetlink::health::BackoffPolicy;
using fleetlink::health::HealthMonitor;
using fleetlink::health::HealthOptions;
using fleetlink::health::HealthStatus;
using fleetlink::testing::FakeBrokerClient;

struct Harness {
  std::shared_ptr<FakeBrokerClient>  client = std::make_shared<FakeBrokerClient>();
  std::shared_ptr<ConnectionManager> connection;
  std::unique_ptr<HealthMonitor>     monitor;

  explicit Harness(HealthOptions options = {}) {
    ConnectionOptions conn;
    conn.subscriptions = {"uagv/v2/+/+/state"};
    connection         = std::make_shared<ConnectionManager>(client, conn);
    monitor            = std::make_unique<HealthMonitor>(connection, [this] { connection->Connect(BrokerConfig{}); }, options);
  }
};

void TestBackoffPolicy() {
  BackoffPolicy policy(2s, 60s, 5);
  assert(policy.DelayAfter(1) == 2s);
  assert(policy.DelayAfter(2) == 4s);
  assert(policy.DelayAfter(3) == 8s);
  assert(policy.DelayAfter(5) == 32s);
  assert(policy.DelayAfter(6) == 60s);
  assert(policy.DelayAfter(40) == 60s);
  assert(!policy.Exhausted(4));
  assert(policy.Exhausted(5));
}

void TestFirstTickConnects() {
  Harness    h;
  const auto t0 = fleetlink::util::Now();
  assert(h.monitor->Status() == HealthStatus::kReconnecting);

  h.monitor->Tick(t0);
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.connection->State() == SessionState::kConnected);
  assert(h.client->ConnectCalls() == 1);
}

void TestBackoffScheduleThenFailed() {
  Harness h;
  h.client->FailNextConnects(5);
  const auto t0 = fleetlink::util::Now();

  h.monitor->Tick(t0);
  assert(h.client->ConnectCalls() == 1);
  assert(h.monitor->Status() == HealthStatus::kReconnecting);
  assert(h.monitor->Report().reconnect_attempts == 1);

  h.monitor->Tick(t0 + 1s);
  assert(h.client->ConnectCalls() == 1);

  // attempts at 0, 2, 6, 14 and 30 seconds
  h.monitor->Tick(t0 + 2s);
  assert(h.client->ConnectCalls() == 2);
  h.monitor->Tick(t0 + 5s);
  assert(h.client->ConnectCalls() == 2);
  h.monitor->Tick(t0 + 6s);
  assert(h.client->ConnectCalls() == 3);
  h.monitor->Tick(t0 + 14s);
  assert(h.client->ConnectCalls() == 4);
  h.monitor->Tick(t0 + 29s);
  assert(h.client->ConnectCalls() == 4);
  h.monitor->Tick(t0 + 30s);
  assert(h.client->ConnectCalls() == 5);

  const auto report = h.monitor->Report();
  assert(report.status == HealthStatus::kFailed);
  assert(report.reconnect_attempts == 5);
  assert(report.last_error == "scripted connect failure");

  // FAILED is sticky
  h.monitor->Tick(t0 + 120s);
  h.monitor->Tick(t0 + 600s);
  assert(h.client->ConnectCalls() == 5);
  assert(h.monitor->Status() == HealthStatus::kFailed);

  // only an explicit request leaves it
  h.monitor->RequestReconnect("operator");
  assert(h.monitor->Status() == HealthStatus::kReconnecting);
  h.monitor->Tick(t0 + 601s);
  assert(h.client->ConnectCalls() == 6);
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.monitor->Report().reconnect_attempts == 0);
}

void TestConfigErrorFailsImmediately() {
  auto          client     = std::make_shared<FakeBrokerClient>();
  auto          connection = std::make_shared<ConnectionManager>(client, ConnectionOptions{});
  HealthMonitor monitor(connection, [] { throw fleetlink::util::ConfigError("credential record failed authentication"); }, HealthOptions{});

  monitor.Tick(fleetlink::util::Now());
  assert(monitor.Status() == HealthStatus::kFailed);
  assert(client->ConnectCalls() == 0);
}

void TestStoreFailureBacksOffLikeConnectionError() {
  auto             client     = std::make_shared<FakeBrokerClient>();
  auto             connection = std::make_shared<ConnectionManager>(client, ConnectionOptions{});
  std::atomic<int> calls{0};
  HealthMonitor    monitor(connection, [&calls] {
    ++calls;
    throw std::runtime_error("sqlite step: database is locked");
  }, HealthOptions{});

  const auto t0 = fleetlink::util::Now();
  monitor.Tick(t0);
  assert(calls == 1);
  assert(monitor.Status() == HealthStatus::kReconnecting);
  assert(monitor.Report().reconnect_attempts == 1);
  assert(monitor.Report().last_error == "sqlite step: database is locked");

  monitor.Tick(t0 + 1s);
  assert(calls == 1);

  monitor.Tick(t0 + 2s);
  monitor.Tick(t0 + 6s);
  monitor.Tick(t0 + 14s);
  assert(calls == 4);
  monitor.Tick(t0 + 30s);
  assert(calls == 5);
  assert(monitor.Status() == HealthStatus::kFailed);

  monitor.Tick(t0 + 300s);
  assert(calls == 5);
}

void TestStoreFailureDoesNotSpinTheThread() {
  auto             client     = std::make_shared<FakeBrokerClient>();
  auto             connection = std::make_shared<ConnectionManager>(client, ConnectionOptions{});
  std::atomic<int> calls{0};
  HealthMonitor    monitor(connection, [&calls] {
    ++calls;
    throw std::runtime_error("sqlite step: database is locked");
  }, HealthOptions{});

  monitor.Start();
  std::this_thread::sleep_for(300ms);
  monitor.Stop();

  // default backoff base is 2s: one attempt only
  assert(calls == 1);
  assert(monitor.Report().reconnect_attempts == 1);
}

void TestConcurrentStartStop() {
  HealthOptions options;
  options.probe_interval = 10ms;
  Harness h(options);

  for (int i = 0; i < 200; ++i) {
    std::thread starter([&] { h.monitor->Start(); });
    std::thread stopper([&] { h.monitor->Stop(); });
    starter.join();
    stopper.join();
  }

  h.monitor->Stop();
  assert(!h.monitor->Running());

  h.monitor->Start();
  assert(h.monitor->Running());
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (h.connection->State() != SessionState::kConnected && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  assert(h.connection->State() == SessionState::kConnected);
  h.monitor->Stop();
}

void TestMissedProbesDegradeThenReconnect() {
  Harness    h;
  const auto t0 = fleetlink::util::Now();
  h.monitor->Tick(t0);
  assert(h.monitor->Status() == HealthStatus::kHealthy);

  h.client->Deliver("uagv/v2/acme/agv-1/state", "{}");

  h.monitor->Tick(t0 + 90s);
  assert(h.monitor->Status() == HealthStatus::kDegraded);
  assert(h.connection->State() == SessionState::kDegraded);
  assert(h.monitor->Report().consecutive_misses == 1);

  h.monitor->Tick(t0 + 120s);
  assert(h.monitor->Status() == HealthStatus::kDegraded);
  assert(h.monitor->Report().consecutive_misses == 2);

  h.client->FailNextConnects(1);
  h.monitor->Tick(t0 + 150s);
  assert(h.monitor->Status() == HealthStatus::kReconnecting);
  assert(h.connection->State() == SessionState::kDisconnected);
  assert(h.client->ConnectCalls() == 2);
  assert(h.monitor->Report().consecutive_misses == 0);

  // backoff retry succeeds; the old subscriptions come back
  h.monitor->Tick(t0 + 152s);
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.client->Subscriptions().size() == 1);
}

void TestQuietSessionWithoutTrafficIsHealthy() {
  Harness    h;
  const auto t0 = fleetlink::util::Now();
  h.monitor->Tick(t0);
  h.monitor->Tick(t0 + 90s);
  h.monitor->Tick(t0 + 120s);
  h.monitor->Tick(t0 + 150s);
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.client->ConnectCalls() == 1);
}

void TestLostSessionIsReconnectedOnNextProbe() {
  Harness    h;
  const auto t0 = fleetlink::util::Now();
  h.monitor->Tick(t0);

  h.client->Drop("connection reset");
  assert(h.connection->State() == SessionState::kDisconnected);

  h.monitor->Tick(t0 + 30s);
  assert(h.client->ConnectCalls() == 2);
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.connection->Session().session_id == 2);
}

void TestProbeRunsHooksAndRecordsCheck() {
  Harness    h;
  int        hook_runs = 0;
  const auto t0        = fleetlink::util::Now();
  h.monitor->AddProbeHook([&](fleetlink::util::TimePoint) { ++hook_runs; });

  h.monitor->Tick(t0);
  h.monitor->Tick(t0 + 10s);
  h.monitor->Tick(t0 + 30s);
  assert(hook_runs == 2);
  assert(h.connection->Session().last_health_check_at == t0 + 30s);
  assert(h.monitor->Report().last_check_at == t0 + 30s);
}

void TestBackgroundThreadConnects() {
  HealthOptions options;
  options.probe_interval = 50ms;
  Harness h(options);

  h.monitor->Start();
  for (int i = 0; i < 200 && h.monitor->Status() != HealthStatus::kHealthy; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  h.monitor->Stop();
  assert(h.monitor->Status() == HealthStatus::kHealthy);
  assert(h.connection->IsConnected());
}

} // namespace

int main() {
  TestBackoffPolicy();
  TestFirstTickConnects();
  TestBackoffScheduleThenFailed();
  TestConfigErrorFailsImmediately();
  TestStoreFailureBacksOffLikeConnectionError();
  TestStoreFailureDoesNotSpinTheThread();
  TestConcurrentStartStop();
  TestMissedProbesDegradeThenReconnect();
  TestQuietSessionWithoutTrafficIsHealthy();
  TestLostSessionIsReconnectedOnNextProbe();
  TestProbeRunsHooksAndRecordsCheck();
  TestBackgroundThreadConnects();

  std::cout << "fleetlink_unit_health_monitor: pass\n";
  return 0;
}
