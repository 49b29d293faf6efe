#include "connection_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fleetlink::connection {

using fleetlink::observability::IntField;
using fleetlink::observability::StringField;
using fleetlink::util::ConnectionError;
using fleetlink::util::PublishError;

ConnectionManager::ConnectionManager(std::shared_ptr<transport::BrokerClient> client, ConnectionOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
  for (const auto& topic : options_.subscriptions) {
    if (std::find(topics_.begin(), topics_.end(), topic) == topics_.end()) {
      topics_.push_back(topic);
    }
  }

  client_->SetMessageHandler([this](const std::string& topic, const std::string& payload) { HandleMessage(topic, payload); });
  client_->SetDisconnectHandler([this](const std::string& reason) { HandleLost(reason); });
}

ConnectionManager::~ConnectionManager() {
  client_->SetMessageHandler(nullptr);
  client_->SetDisconnectHandler(nullptr);
  try {
    Disconnect();
  } catch (const std::exception& e) {
    FLEETLINK_LOG_WARN("Broker disconnect failed during teardown", {StringField("error", e.what())});
  }
}

bool ConnectionManager::Transition(SessionState next) {
  std::lock_guard lock(transition_mutex_);
  const auto      previous = state_.Load();
  if (previous == next || !CanTransition(previous, next)) {
    return false;
  }
  {
    std::lock_guard session_lock(session_mutex_);
    session_.state = next;
  }
  state_.Store(next);
  FLEETLINK_LOG_DEBUG("Session state changed", {StringField("from", ToString(previous)), StringField("to", ToString(next))});
  return true;
}

// ------------------------------------------------------------
// Session lifecycle
// ------------------------------------------------------------

void ConnectionManager::Connect(const credentials::BrokerConfig& config) {
  std::lock_guard connect_lock(connect_mutex_);

  if (IsUp(state_.Load())) {
    client_->Disconnect();
    Transition(SessionState::kDisconnected);
  }
  Transition(SessionState::kConnecting);

  transport::BrokerOptions opts;
  opts.host            = config.host;
  opts.port            = config.port;
  opts.use_tls         = config.use_tls;
  opts.ca_file         = config.ca_file;
  opts.username        = config.username;
  opts.password        = config.password;
  opts.keepalive_sec   = config.keepalive_sec;
  opts.connect_timeout = options_.connect_timeout;
  opts.client_id       = config.client_id.empty() ? config.client_id_prefix + "-" + util::RandomToken(4) : config.client_id;

  const auto broker = credentials::BrokerUrl(config);
  {
    std::lock_guard lock(session_mutex_);
    session_.broker_url = broker;
    session_.client_id  = opts.client_id;
  }
  FLEETLINK_LOG_INFO("Connecting to broker", {StringField("broker", broker), StringField("client_id", opts.client_id)});

  try {
    client_->Connect(opts);
  } catch (const ConnectionError& e) {
    {
      std::lock_guard lock(session_mutex_);
      session_.last_error = e.what();
    }
    Transition(SessionState::kDisconnected);
    FLEETLINK_LOG_WARN("Broker connect failed",
                       {StringField("broker", broker), StringField("kind", util::ToString(e.kind())), StringField("error", e.what())});
    throw;
  }

  std::vector<std::string> topics;
  {
    std::lock_guard lock(session_mutex_);
    topics = topics_;
  }

  try {
    for (const auto& topic : topics) {
      client_->Subscribe(topic, options_.qos);
    }
  } catch (const ConnectionError& e) {
    client_->Disconnect();
    {
      std::lock_guard lock(session_mutex_);
      session_.last_error = e.what();
    }
    Transition(SessionState::kDisconnected);
    FLEETLINK_LOG_WARN("Subscribing fleet topics failed", {StringField("broker", broker), StringField("error", e.what())});
    throw;
  }

  uint64_t session_id = 0;
  {
    std::lock_guard lock(session_mutex_);
    session_id            = ++session_.session_id;
    session_.connected_at = util::Now();
    session_.last_error.clear();
  }
  Transition(SessionState::kConnected);

  FLEETLINK_LOG_INFO("Broker session established", {StringField("broker", broker), IntField("session_id", static_cast<int64_t>(session_id)),
                                                    IntField("topics", static_cast<int64_t>(topics.size()))});
}

void ConnectionManager::Disconnect() {
  std::lock_guard connect_lock(connect_mutex_);

  if (IsUp(state_.Load())) {
    std::vector<std::string> topics;
    {
      std::lock_guard lock(session_mutex_);
      topics = topics_;
    }
    for (const auto& topic : topics) {
      client_->Unsubscribe(topic);
    }
  }
  client_->Disconnect();

  if (Transition(SessionState::kDisconnected)) {
    FLEETLINK_LOG_INFO("Broker session released");
  }
}

void ConnectionManager::CancelConnect() {
  client_->Abort();
}

void ConnectionManager::HandleLost(const std::string& reason) {
  {
    std::lock_guard lock(session_mutex_);
    session_.last_error = reason;
  }
  Transition(SessionState::kDisconnected);
}

// ------------------------------------------------------------
// Traffic
// ------------------------------------------------------------

void ConnectionManager::Subscribe(const std::string& filter) {
  {
    std::lock_guard lock(session_mutex_);
    if (std::find(topics_.begin(), topics_.end(), filter) != topics_.end()) {
      return;
    }
    topics_.push_back(filter);
  }
  if (IsUp(state_.Load())) {
    client_->Subscribe(filter, options_.qos);
  }
}

void ConnectionManager::Publish(const std::string& topic, const std::string& payload) {
  const auto state = state_.Load();
  if (state != SessionState::kConnected) {
    throw PublishError("cannot publish to " + topic + ": broker session is " + std::string(ToString(state)));
  }
  client_->Publish(topic, payload, options_.qos, options_.publish_timeout);
}

void ConnectionManager::SetFrameHandler(FrameHandler handler) {
  std::lock_guard lock(handler_mutex_);
  frame_handler_ = std::move(handler);
}

void ConnectionManager::HandleMessage(const std::string& topic, const std::string& payload) {
  const auto arrived_at = util::Now();
  last_inbound_ms_.store(static_cast<int64_t>(util::ToUnixMillis(arrived_at)), std::memory_order_relaxed);

  FrameHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = frame_handler_;
  }
  if (!handler) {
    return;
  }

  try {
    handler(topic, payload, arrived_at);
  } catch (const std::exception& e) {
    FLEETLINK_LOG_ERROR("Inbound frame handler failed", {StringField("topic", topic), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Health surface
// ------------------------------------------------------------

void ConnectionManager::MarkHeartbeatMissed() {
  if (state_.Load() == SessionState::kConnected) {
    Transition(SessionState::kDegraded);
  }
}

void ConnectionManager::MarkHeartbeatOk() {
  if (state_.Load() == SessionState::kDegraded) {
    Transition(SessionState::kConnected);
  }
}

void ConnectionManager::RecordHealthCheck(util::TimePoint at, uint32_t reconnect_attempts) {
  std::lock_guard lock(session_mutex_);
  session_.last_health_check_at = at;
  session_.reconnect_attempts   = reconnect_attempts;
}

SessionState ConnectionManager::State() const {
  return state_.Load();
}

bool ConnectionManager::IsConnected() const {
  return state_.Load() == SessionState::kConnected;
}

ConnectionSession ConnectionManager::Session() const {
  std::lock_guard lock(session_mutex_);
  ConnectionSession session = session_;
  session.state             = state_.Load();
  return session;
}

std::optional<util::TimePoint> ConnectionManager::LastInboundAt() const {
  const auto ms = last_inbound_ms_.load(std::memory_order_relaxed);
  if (ms == 0) {
    return std::nullopt;
  }
  return util::TimePoint{} + std::chrono::milliseconds(ms);
}

// ------------------------------------------------------------
// SessionGuard
// ------------------------------------------------------------

SessionGuard::SessionGuard(ConnectionManager& manager, const credentials::BrokerConfig& config) : manager_(manager) {
  manager_.Connect(config);
}

SessionGuard::~SessionGuard() {
  try {
    manager_.Disconnect();
  } catch (const std::exception& e) {
    FLEETLINK_LOG_WARN("Session release failed", {StringField("error", e.what())});
  }
}

} // namespace fleetlink::connection
