#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/credentials/broker_config.hpp"
#include "internal/transport/broker_client.hpp"
#include "internal/util/observable_cell.hpp"
#include "internal/util/time.hpp"
#include "session_state.hpp"

namespace fleetlink::connection {

struct ConnectionOptions {
  std::vector<std::string>  subscriptions; // fixed fleet topic set
  int                       qos = 1;
  std::chrono::milliseconds connect_timeout{10'000};
  std::chrono::milliseconds publish_timeout{5'000};
};

struct ConnectionSession {
  uint64_t                       session_id         = 0;
  SessionState                   state              = SessionState::kDisconnected;
  uint32_t                       reconnect_attempts = 0;
  std::optional<util::TimePoint> connected_at;
  std::optional<util::TimePoint> last_health_check_at;
  std::string                    broker_url;
  std::string                    client_id;
  std::string                    last_error;
};

/*
  Owns the broker session.

  - Connect() never retries; failures surface as util::ConnectionError
  - every topic ever subscribed is remembered and re-subscribed on the next
    successful Connect()
  - inbound frames are forwarded, stamped with their arrival time, to the
    single installed frame handler
  - Publish() requires state CONNECTED and is bounded by publish_timeout
*/
class ConnectionManager {
 public:
  using FrameHandler = std::function<void(const std::string& topic, const std::string& payload, util::TimePoint arrived_at)>;

  ConnectionManager(std::shared_ptr<transport::BrokerClient> client, ConnectionOptions options);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&)            = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  void Connect(const credentials::BrokerConfig& config);
  void Disconnect();

  // Aborts an in-flight Connect(); it then throws ConnectionError(kCancelled).
  void CancelConnect();

  void Subscribe(const std::string& filter);
  void Publish(const std::string& topic, const std::string& payload);

  void SetFrameHandler(FrameHandler handler);

  void MarkHeartbeatMissed();
  void MarkHeartbeatOk();
  void RecordHealthCheck(util::TimePoint at, uint32_t reconnect_attempts);

  SessionState                   State() const;
  bool                           IsConnected() const;
  ConnectionSession              Session() const;
  std::optional<util::TimePoint> LastInboundAt() const;

  util::ObservableCell<SessionState>& StateCell() {
    return state_;
  }

 private:
  bool Transition(SessionState next);
  void HandleMessage(const std::string& topic, const std::string& payload);
  void HandleLost(const std::string& reason);

  std::shared_ptr<transport::BrokerClient> client_;
  ConnectionOptions                        options_;

  std::mutex                         connect_mutex_; // at most one Connect() in flight
  std::mutex                         transition_mutex_;
  util::ObservableCell<SessionState> state_{SessionState::kDisconnected};

  mutable std::mutex       session_mutex_;
  ConnectionSession        session_;
  std::vector<std::string> topics_;

  std::atomic<int64_t> last_inbound_ms_{0};

  std::mutex   handler_mutex_;
  FrameHandler frame_handler_;
};

/*
  Scoped session: Connect() on construction, Disconnect() on destruction.
*/
class SessionGuard {
 public:
  SessionGuard(ConnectionManager& manager, const credentials::BrokerConfig& config);
  ~SessionGuard();

  SessionGuard(const SessionGuard&)            = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

 private:
  ConnectionManager& manager_;
};

} // namespace fleetlink::connection
