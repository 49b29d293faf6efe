#include "health_monitor.hpp"

#include <algorithm>

#include "internal/connection/connection_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace fleetlink::health {

using fleetlink::observability::IntField;
using fleetlink::observability::StringField;

std::string_view ToString(HealthStatus status) {
  switch (status) {
    case HealthStatus::kHealthy:
      return "HEALTHY";
    case HealthStatus::kReconnecting:
      return "RECONNECTING";
    case HealthStatus::kDegraded:
      return "DEGRADED";
    case HealthStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

HealthMonitor::HealthMonitor(std::shared_ptr<connection::ConnectionManager> connection, ConnectFn connect, HealthOptions options)
    : connection_(std::move(connection)),
      connect_(std::move(connect)),
      options_(options),
      backoff_(options.backoff_base, options.backoff_max, options.max_attempts) {
  if (options_.missed_probes_threshold == 0) {
    options_.missed_probes_threshold = 1;
  }
}

HealthMonitor::~HealthMonitor() {
  Stop();
}

void HealthMonitor::AddProbeHook(ProbeHook hook) {
  std::lock_guard lock(mutex_);
  hooks_.push_back(std::move(hook));
}

// ------------------------------------------------------------
// Thread
// ------------------------------------------------------------

void HealthMonitor::Start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  {
    std::lock_guard lock(mutex_);
    running_ = true;
  }
  thread_ = std::thread(&HealthMonitor::Run, this);
}

void HealthMonitor::Stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool HealthMonitor::Running() const {
  std::lock_guard lock(mutex_);
  return running_;
}

void HealthMonitor::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    auto wake_at = next_probe_at_;
    if (status_.Load() == HealthStatus::kReconnecting) {
      wake_at = std::min(wake_at, next_attempt_at_);
    }
    cv_.wait_until(lock, wake_at, [this] { return !running_ || wake_; });
    if (!running_) {
      break;
    }
    wake_ = false;

    lock.unlock();
    try {
      Tick(util::Now());
    } catch (const std::exception& e) {
      FLEETLINK_LOG_ERROR("Health probe failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

// ------------------------------------------------------------
// Policy
// ------------------------------------------------------------

void HealthMonitor::Tick(util::TimePoint now) {
  bool                   attempt  = false;
  bool                   probe    = false;
  uint32_t               attempts = 0;
  std::vector<ProbeHook> hooks;
  {
    std::lock_guard lock(mutex_);
    attempt = status_.Load() == HealthStatus::kReconnecting && now >= next_attempt_at_;
    if (now >= next_probe_at_) {
      probe          = true;
      next_probe_at_ = now + options_.probe_interval;
      last_check_at_ = now;
      hooks          = hooks_;
    }
    attempts = attempts_;
  }

  if (probe) {
    for (const auto& hook : hooks) {
      hook(now);
    }
    connection_->RecordHealthCheck(now, attempts);
    if (!attempt) {
      attempt = Probe(now);
    }
  }

  if (attempt) {
    Attempt(now);
  }
}

bool HealthMonitor::Probe(util::TimePoint now) {
  const auto current = status_.Load();
  if (current == HealthStatus::kFailed || current == HealthStatus::kReconnecting) {
    return false;
  }

  const auto session = connection_->Session();
  if (session.state == connection::SessionState::kDisconnected) {
    std::lock_guard lock(mutex_);
    misses_          = 0;
    attempts_        = 0;
    next_attempt_at_ = now;
    last_error_      = session.last_error;
    status_.Store(HealthStatus::kReconnecting);
    FLEETLINK_LOG_WARN("Broker session lost, reconnecting", {StringField("error", session.last_error)});
    return true;
  }
  if (session.state == connection::SessionState::kConnecting) {
    return false;
  }

  // Freshness only counts once the current session has carried traffic.
  bool       fresh = true;
  const auto last  = connection_->LastInboundAt();
  if (last && session.connected_at && *last >= *session.connected_at && now - *last > options_.freshness_threshold) {
    fresh = false;
  }

  if (fresh) {
    connection_->MarkHeartbeatOk();
    std::lock_guard lock(mutex_);
    misses_ = 0;
    status_.Store(HealthStatus::kHealthy);
    return false;
  }

  connection_->MarkHeartbeatMissed();

  uint32_t misses = 0;
  {
    std::lock_guard lock(mutex_);
    misses = ++misses_;
    if (misses < options_.missed_probes_threshold) {
      status_.Store(HealthStatus::kDegraded);
    } else {
      misses_          = 0;
      attempts_        = 0;
      next_attempt_at_ = now;
      last_error_      = "no inbound traffic for " + std::to_string(options_.missed_probes_threshold) + " probes";
      status_.Store(HealthStatus::kReconnecting);
    }
  }

  if (misses < options_.missed_probes_threshold) {
    FLEETLINK_LOG_WARN("Heartbeat missed", {IntField("consecutive_misses", misses)});
    return false;
  }

  FLEETLINK_LOG_WARN("Heartbeat lost, dropping session", {IntField("consecutive_misses", misses)});
  connection_->Disconnect();
  return true;
}

void HealthMonitor::Attempt(util::TimePoint now) {
  uint64_t generation = 0;
  uint32_t attempt_no = 0;
  {
    std::lock_guard lock(mutex_);
    generation = generation_;
    attempt_no = attempts_ + 1;
  }
  FLEETLINK_LOG_INFO("Reconnect attempt", {IntField("attempt", attempt_no), IntField("max_attempts", backoff_.MaxAttempts())});

  try {
    connect_();
    observability::Metrics::Instance().RecordReconnectAttempt(true);

    std::lock_guard lock(mutex_);
    if (generation != generation_) {
      return;
    }
    attempts_      = 0;
    misses_        = 0;
    next_probe_at_ = now + options_.probe_interval;
    last_error_.clear();
    status_.Store(HealthStatus::kHealthy);
  } catch (const util::ConfigError& e) {
    observability::Metrics::Instance().RecordReconnectAttempt(false);

    std::lock_guard lock(mutex_);
    if (generation != generation_) {
      return;
    }
    last_error_ = e.what();
    status_.Store(HealthStatus::kFailed);
    FLEETLINK_LOG_ERROR("Broker configuration unusable, reconfiguration required", {StringField("error", e.what())});
  } catch (const util::ConnectionError& e) {
    observability::Metrics::Instance().RecordReconnectAttempt(false);
    AttemptFailed(now, generation, attempt_no, util::ToString(e.kind()), e.what());
  } catch (const std::exception& e) {
    // store or cipher failures while resolving the broker config
    observability::Metrics::Instance().RecordReconnectAttempt(false);
    AttemptFailed(now, generation, attempt_no, "internal", e.what());
  }
}

void HealthMonitor::AttemptFailed(util::TimePoint now, uint64_t generation, uint32_t attempt_no, std::string_view kind,
                                  const std::string& error) {
  std::lock_guard lock(mutex_);
  if (generation != generation_) {
    return;
  }
  attempts_   = attempt_no;
  last_error_ = error;
  if (backoff_.Exhausted(attempts_)) {
    status_.Store(HealthStatus::kFailed);
    FLEETLINK_LOG_ERROR("Reconnect attempts exhausted, manual reconnect required",
                        {IntField("attempts", attempts_), StringField("kind", kind), StringField("error", error)});
    return;
  }
  const auto delay = backoff_.DelayAfter(attempts_);
  next_attempt_at_ = now + delay;
  FLEETLINK_LOG_WARN("Reconnect attempt failed", {IntField("attempt", attempts_), IntField("retry_in_ms", delay.count()),
                                                  StringField("kind", kind), StringField("error", error)});
}

void HealthMonitor::RequestReconnect(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    ++generation_;
    attempts_        = 0;
    misses_          = 0;
    next_attempt_at_ = util::TimePoint{};
    wake_            = true;
    status_.Store(HealthStatus::kReconnecting);
  }
  cv_.notify_all();
  FLEETLINK_LOG_INFO("Reconnect requested", {StringField("reason", reason)});
}

HealthStatus HealthMonitor::Status() const {
  return status_.Load();
}

HealthReport HealthMonitor::Report() const {
  std::lock_guard lock(mutex_);
  HealthReport    report;
  report.status             = status_.Load();
  report.reconnect_attempts = attempts_;
  report.consecutive_misses = misses_;
  report.last_check_at      = last_check_at_;
  report.last_error         = last_error_;
  return report;
}

} // namespace fleetlink::health
