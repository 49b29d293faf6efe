#include "fleet_runtime.hpp"

#include "internal/connection/connection_manager.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/health/health_monitor.hpp"
#include "internal/mission/mission_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/pipeline/frame_pipeline.hpp"
#include "internal/protocol/protocol_codec.hpp"
#include "internal/telemetry/telemetry_store.hpp"
#include "internal/transport/broker_client.hpp"

namespace fleetlink::runtime {

using fleetlink::observability::IntField;
using fleetlink::observability::StringField;

FleetRuntime::FleetRuntime(fleetlink::config::RuntimeOptions options, std::shared_ptr<credentials::CredentialStore> credentials,
                           std::shared_ptr<transport::BrokerClient> client)
    : options_(std::move(options)), credentials_(std::move(credentials)), client_(std::move(client)) {
  if (options_.connection.subscriptions.empty()) {
    options_.connection.subscriptions = protocol::FleetSubscriptions(options_.codec.interface_name, options_.codec.major_version);
  }

  // ------------------------------------------------------------------
  // Data path
  // ------------------------------------------------------------------
  codec_      = std::make_shared<protocol::ProtocolCodec>(options_.codec);
  telemetry_  = std::make_shared<telemetry::TelemetryStore>(options_.telemetry);
  connection_ = std::make_shared<connection::ConnectionManager>(client_, options_.connection);
  dispatcher_ = std::make_shared<mission::MissionDispatcher>(codec_, connection_, telemetry_, options_.mission);
  pipeline_   = std::make_shared<pipeline::FramePipeline>(codec_, telemetry_, dispatcher_);

  connection_->SetFrameHandler([this](const std::string& topic, const std::string& payload, util::TimePoint arrived_at) {
    pipeline_->Handle(topic, payload, arrived_at);
  });

  // ------------------------------------------------------------------
  // Supervision
  // ------------------------------------------------------------------
  health_ = std::make_shared<health::HealthMonitor>(
      connection_, [this] { connection_->Connect(ResolveBroker()); }, options_.health);
  health_->AddProbeHook([this](util::TimePoint now) { OnProbe(now); });

  health_->StatusCell().Subscribe([](health::HealthStatus previous, health::HealthStatus current) {
    FLEETLINK_LOG_INFO("Health status changed", {StringField("from", health::ToString(previous)), StringField("to", health::ToString(current))});
  });
}

FleetRuntime::~FleetRuntime() {
  Shutdown();
  connection_->SetFrameHandler(nullptr);
}

void FleetRuntime::OnProbe(util::TimePoint now) {
  const auto demoted = telemetry_->EvictStale(now);
  if (demoted > 0) {
    FLEETLINK_LOG_INFO("Vehicles demoted", {IntField("count", static_cast<int64_t>(demoted))});
  }
  dispatcher_->ExpireOverdue(now);

  const auto counts  = telemetry_->Counts();
  auto&      metrics = observability::Metrics::Instance();
  metrics.SetVehicleCount("ONLINE", counts.online);
  metrics.SetVehicleCount("STALE", counts.stale);
  metrics.SetVehicleCount("OFFLINE", counts.offline);
}

// ------------------------------------------------------------
// Session lifecycle
// ------------------------------------------------------------

void FleetRuntime::Attach() {
  {
    std::lock_guard lock(mutex_);
    last_activity_ = util::Now();
    if (attached_) {
      return;
    }
  }

  // Serialized against teardown so a reap in progress finishes before the session restarts.
  std::lock_guard session(session_mutex_);
  {
    std::lock_guard lock(mutex_);
    last_activity_ = util::Now();
    if (attached_) {
      return;
    }
    attached_ = true;
  }

  FLEETLINK_LOG_INFO("Client attached, starting fleet session");
  health_->RequestReconnect("client attached");
  health_->Start();
}

bool FleetRuntime::Attached() const {
  std::lock_guard lock(mutex_);
  return attached_;
}

bool FleetRuntime::ReapIdle(util::TimePoint now) {
  std::lock_guard session(session_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (!attached_ || now - last_activity_ < options_.idle_timeout) {
      return false;
    }
    attached_ = false;
  }
  Teardown("idle timeout");
  return true;
}

void FleetRuntime::Teardown(const char* reason) {
  connection_->CancelConnect();
  health_->Stop();
  connection_->Disconnect();
  FLEETLINK_LOG_INFO("Fleet session torn down", {StringField("reason", reason)});
}

void FleetRuntime::StartReaper() {
  std::lock_guard lock(mutex_);
  if (reaper_running_) {
    return;
  }
  reaper_running_ = true;
  reaper_         = std::thread(&FleetRuntime::RunReaper, this);
}

void FleetRuntime::RunReaper() {
  std::unique_lock lock(mutex_);
  while (reaper_running_) {
    const auto wake_at = attached_ ? last_activity_ + options_.idle_timeout : util::Now() + options_.idle_timeout;
    reaper_cv_.wait_until(lock, wake_at, [this] { return !reaper_running_; });
    if (!reaper_running_) {
      break;
    }
    lock.unlock();
    ReapIdle(util::Now());
    lock.lock();
  }
}

void FleetRuntime::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    reaper_running_ = false;
  }
  reaper_cv_.notify_all();
  if (reaper_.joinable()) {
    reaper_.join();
  }

  std::lock_guard session(session_mutex_);
  bool            was_attached = false;
  {
    std::lock_guard lock(mutex_);
    was_attached = attached_;
    attached_    = false;
  }
  if (was_attached) {
    Teardown("shutdown");
  }
}

// ------------------------------------------------------------
// Broker configuration
// ------------------------------------------------------------

credentials::BrokerConfig FleetRuntime::ResolveBroker() const {
  const auto stored = credentials_->Get();

  bool overrides_active = false;
  {
    std::lock_guard lock(mutex_);
    overrides_active = overrides_active_;
  }
  if (!overrides_active) {
    return stored;
  }
  return credentials::ResolveBrokerConfig(stored, options_.broker_overrides);
}

void FleetRuntime::UpdateBrokerConfig(const credentials::BrokerConfig& config) {
  credentials_->Put(config);

  bool attached = false;
  {
    std::lock_guard lock(mutex_);
    // An explicit update supersedes the start-up overrides.
    overrides_active_ = false;
    attached          = attached_;
  }
  if (!attached) {
    return;
  }

  connection_->CancelConnect();
  connection_->Disconnect();
  health_->RequestReconnect("broker configuration updated");
}

void FleetRuntime::Reconnect() {
  Attach();
  health_->RequestReconnect("manual reconnect");
}

} // namespace fleetlink::runtime
