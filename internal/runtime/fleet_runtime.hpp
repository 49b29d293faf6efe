#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/config/runtime_options.hpp"
#include "internal/credentials/broker_config.hpp"
#include "internal/util/time.hpp"

namespace fleetlink::credentials {
class CredentialStore;
}
namespace fleetlink::transport {
class BrokerClient;
}
namespace fleetlink::pipeline {
class FramePipeline;
}

namespace fleetlink::runtime {

/*
  Process-wide fleet connection service.

  LIFECYCLE:

    constructed   components wired, no broker session
    Attach()      first call starts the health supervisor, which opens the
                  broker session; every call refreshes the activity stamp
    idle reaper   no Attach() for idle_timeout: session torn down; the next
                  Attach() starts over
    Shutdown()    cancels any in-flight connect and disconnects

  Telemetry and mission history survive idle teardown.
*/
class FleetRuntime {
 public:
  FleetRuntime(fleetlink::config::RuntimeOptions options, std::shared_ptr<credentials::CredentialStore> credentials,
               std::shared_ptr<transport::BrokerClient> client);
  ~FleetRuntime();

  FleetRuntime(const FleetRuntime&)            = delete;
  FleetRuntime& operator=(const FleetRuntime&) = delete;

  void Attach();
  bool Attached() const;

  // Tears the session down when idle longer than idle_timeout at `now`. Returns true if it did.
  bool ReapIdle(util::TimePoint now);

  void StartReaper();
  void Shutdown();

  // Persists the config, drops the current session and reconnects with it.
  void UpdateBrokerConfig(const credentials::BrokerConfig& config);

  // Effective broker config: stored record overlaid by the process configuration.
  credentials::BrokerConfig ResolveBroker() const;

  void Reconnect();

  const fleetlink::config::RuntimeOptions& Options() const {
    return options_;
  }

  std::shared_ptr<protocol::ProtocolCodec> Codec() const {
    return codec_;
  }
  std::shared_ptr<telemetry::TelemetryStore> Telemetry() const {
    return telemetry_;
  }
  std::shared_ptr<connection::ConnectionManager> Connection() const {
    return connection_;
  }
  std::shared_ptr<health::HealthMonitor> Health() const {
    return health_;
  }
  std::shared_ptr<mission::MissionDispatcher> Dispatcher() const {
    return dispatcher_;
  }
  std::shared_ptr<pipeline::FramePipeline> Pipeline() const {
    return pipeline_;
  }
  std::shared_ptr<credentials::CredentialStore> Credentials() const {
    return credentials_;
  }

 private:
  void Teardown(const char* reason);
  void RunReaper();
  void OnProbe(util::TimePoint now);

  fleetlink::config::RuntimeOptions             options_;
  std::shared_ptr<credentials::CredentialStore> credentials_;
  std::shared_ptr<transport::BrokerClient>      client_;

  std::shared_ptr<protocol::ProtocolCodec>       codec_;
  std::shared_ptr<telemetry::TelemetryStore>     telemetry_;
  std::shared_ptr<connection::ConnectionManager> connection_;
  std::shared_ptr<mission::MissionDispatcher>    dispatcher_;
  std::shared_ptr<pipeline::FramePipeline>       pipeline_;
  std::shared_ptr<health::HealthMonitor>         health_;

  // Held across attach and teardown; taken before mutex_.
  std::mutex              session_mutex_;
  mutable std::mutex      mutex_;
  std::condition_variable reaper_cv_;
  bool                    attached_         = false;
  bool                    overrides_active_ = true;
  bool                    reaper_running_   = false;
  util::TimePoint         last_activity_{};
  std::thread             reaper_;
};

} // namespace fleetlink::runtime
