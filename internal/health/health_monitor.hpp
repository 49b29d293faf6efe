#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "backoff_policy.hpp"
#include "internal/util/observable_cell.hpp"
#include "internal/util/time.hpp"

namespace fleetlink::connection {
class ConnectionManager;
}

namespace fleetlink::health {

enum class HealthStatus {
  kHealthy,
  kReconnecting,
  kDegraded,
  kFailed,
};

std::string_view ToString(HealthStatus status);

struct HealthOptions {
  std::chrono::milliseconds probe_interval{30'000};
  std::chrono::milliseconds freshness_threshold{60'000};
  uint32_t                  missed_probes_threshold = 3;
  std::chrono::milliseconds backoff_base{2'000};
  std::chrono::milliseconds backoff_max{60'000};
  uint32_t                  max_attempts = 5;
};

struct HealthReport {
  HealthStatus                   status             = HealthStatus::kReconnecting;
  uint32_t                       reconnect_attempts = 0;
  uint32_t                       consecutive_misses = 0;
  std::optional<util::TimePoint> last_check_at;
  std::string                    last_error;
};

/*
  Liveness supervisor of the broker session.

  Every probe_interval:
    - probe hooks run (telemetry eviction, mission timeouts)
    - a DISCONNECTED session switches to RECONNECTING and is retried at once
    - a connected session that received traffic but none within
      freshness_threshold counts a miss (DEGRADED); missed_probes_threshold
      consecutive misses drop the session and switch to RECONNECTING

  RECONNECTING retries with exponential backoff; after max_attempts failed
  attempts (or any ConfigError) the status is FAILED and only
  RequestReconnect() leaves it.

  Tick() holds the whole policy and can be driven directly with synthetic
  time; Start() runs it on a dedicated thread. At most one connect attempt is
  in flight. Status listeners run under the monitor lock and must not call
  back into the monitor.
*/
class HealthMonitor {
 public:
  using ConnectFn = std::function<void()>;
  using ProbeHook = std::function<void(util::TimePoint now)>;

  HealthMonitor(std::shared_ptr<connection::ConnectionManager> connection, ConnectFn connect, HealthOptions options);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&)            = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void AddProbeHook(ProbeHook hook);

  // Start and Stop may race each other; Start after Stop runs a fresh thread.
  void Start();
  void Stop();
  bool Running() const;

  void Tick(util::TimePoint now);

  // Leaves FAILED (or interrupts the current state): attempts reset, next attempt immediate.
  void RequestReconnect(const std::string& reason);

  HealthStatus Status() const;
  HealthReport Report() const;

  util::ObservableCell<HealthStatus>& StatusCell() {
    return status_;
  }

 private:
  // Returns true when a connect attempt must follow immediately.
  bool Probe(util::TimePoint now);
  void Attempt(util::TimePoint now);
  void AttemptFailed(util::TimePoint now, uint64_t generation, uint32_t attempt_no, std::string_view kind, const std::string& error);
  void Run();

  std::shared_ptr<connection::ConnectionManager> connection_;
  ConnectFn                                      connect_;
  HealthOptions                                  options_;
  BackoffPolicy                                  backoff_;

  std::vector<ProbeHook> hooks_;

  std::mutex                         lifecycle_mutex_;
  mutable std::mutex                 mutex_;
  std::condition_variable            cv_;
  util::ObservableCell<HealthStatus> status_{HealthStatus::kReconnecting};
  uint32_t                           attempts_   = 0;
  uint32_t                           misses_     = 0;
  uint64_t                           generation_ = 0;
  util::TimePoint                    next_probe_at_{};
  util::TimePoint                    next_attempt_at_{};
  std::optional<util::TimePoint>     last_check_at_;
  std::string                        last_error_;
  bool                               wake_ = false;

  std::thread thread_;
  bool        running_ = false;
};

} // namespace fleetlink::health
