#include "mosquitto_client.hpp"

#include <mosquitto.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleetlink::transport {

using fleetlink::util::ConnectionError;
using fleetlink::util::PublishError;

namespace {

std::once_flag g_lib_init;

ConnectionError Classify(int rc, const std::string& context) {
  const std::string message = context + ": " + mosquitto_strerror(rc);
  switch (rc) {
    case MOSQ_ERR_EAI:
      return ConnectionError(ConnectionError::Kind::kDns, message);
    case MOSQ_ERR_TLS:
      return ConnectionError(ConnectionError::Kind::kTls, message);
    case MOSQ_ERR_AUTH:
      return ConnectionError(ConnectionError::Kind::kAuth, message);
    default:
      return ConnectionError(ConnectionError::Kind::kNetwork, message);
  }
}

ConnectionError ClassifyConnack(int rc) {
  const std::string message = std::string("broker refused session: ") + mosquitto_connack_string(rc);
  // 4/5: MQTT 3.1.1 bad credentials / not authorized, 134/135: MQTT 5 equivalents
  if (rc == 4 || rc == 5 || rc == 134 || rc == 135) {
    return ConnectionError(ConnectionError::Kind::kAuth, message);
  }
  return ConnectionError(ConnectionError::Kind::kNetwork, message);
}

} // namespace

MosquittoClient::MosquittoClient() {
  std::call_once(g_lib_init, [] { mosquitto_lib_init(); });
}

MosquittoClient::~MosquittoClient() {
  Disconnect();
}

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

void MosquittoClient::Connect(const BrokerOptions& options) {
  std::lock_guard connect_lock(connect_mutex_);

  StopLoop();
  DestroyHandle();
  {
    std::lock_guard lock(state_mutex_);
    connack_.reset();
    loop_error_ = 0;
    aborted_    = false;
    awaiting_mids_.clear();
    acked_mids_.clear();
  }

  {
    std::unique_lock handle(handle_mutex_);
    mosq_ = mosquitto_new(options.client_id.empty() ? nullptr : options.client_id.c_str(), true, this);
  }
  if (!mosq_) {
    throw ConnectionError(ConnectionError::Kind::kNetwork, "mosquitto_new failed");
  }
  mosquitto_threaded_set(mosq_, true);
  mosquitto_int_option(mosq_, MOSQ_OPT_PROTOCOL_VERSION, MQTT_PROTOCOL_V311);
  mosquitto_connect_callback_set(mosq_, &MosquittoClient::OnConnect);
  mosquitto_disconnect_callback_set(mosq_, &MosquittoClient::OnDisconnect);
  mosquitto_publish_callback_set(mosq_, &MosquittoClient::OnPublish);
  mosquitto_message_callback_set(mosq_, &MosquittoClient::OnMessage);

  if (!options.username.empty()) {
    const int rc = mosquitto_username_pw_set(mosq_, options.username.c_str(), options.password.empty() ? nullptr : options.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS) {
      DestroyHandle();
      throw Classify(rc, "credentials rejected by client library");
    }
  }

  if (options.use_tls) {
    const int rc = options.ca_file.empty() ? mosquitto_int_option(mosq_, MOSQ_OPT_TLS_USE_OS_CERTS, 1)
                                           : mosquitto_tls_set(mosq_, options.ca_file.c_str(), nullptr, nullptr, nullptr, nullptr);
    if (rc != MOSQ_ERR_SUCCESS) {
      DestroyHandle();
      throw ConnectionError(ConnectionError::Kind::kTls, std::string("TLS setup failed: ") + mosquitto_strerror(rc));
    }
  }

  const int rc = mosquitto_connect_async(mosq_, options.host.c_str(), static_cast<int>(options.port), static_cast<int>(options.keepalive_sec));
  if (rc != MOSQ_ERR_SUCCESS) {
    DestroyHandle();
    throw Classify(rc, "connect to " + options.host);
  }

  loop_running_ = true;
  loop_thread_  = std::thread(&MosquittoClient::RunLoop, this);

  std::optional<ConnectionError> failure;
  {
    std::unique_lock lock(state_mutex_);
    const bool       settled =
        state_cv_.wait_for(lock, options.connect_timeout, [this] { return connack_.has_value() || loop_error_ != 0 || aborted_; });

    if (aborted_) {
      failure.emplace(ConnectionError::Kind::kCancelled, "connect cancelled");
    } else if (!settled) {
      failure.emplace(ConnectionError::Kind::kTimeout, "no CONNACK from " + options.host + " within " +
                                                           std::to_string(options.connect_timeout.count()) + "ms");
    } else if (connack_.has_value()) {
      if (*connack_ != 0) {
        failure.emplace(ClassifyConnack(*connack_));
      }
    } else {
      failure.emplace(Classify(loop_error_, "connect to " + options.host));
    }
  }

  if (failure) {
    StopLoop();
    DestroyHandle();
    throw *failure;
  }
  connected_ = true;
}

void MosquittoClient::Abort() {
  {
    std::lock_guard lock(state_mutex_);
    aborted_ = true;
  }
  state_cv_.notify_all();
}

void MosquittoClient::Disconnect() {
  std::lock_guard connect_lock(connect_mutex_);
  connected_ = false;
  if (mosq_) {
    mosquitto_disconnect(mosq_);
  }
  StopLoop();
  DestroyHandle();
  state_cv_.notify_all();
}

bool MosquittoClient::IsConnected() const {
  return connected_.load();
}

void MosquittoClient::StopLoop() {
  loop_running_ = false;
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

void MosquittoClient::DestroyHandle() {
  std::unique_lock handle(handle_mutex_);
  if (mosq_) {
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
  }
}

void MosquittoClient::RunLoop() {
  while (loop_running_) {
    const int rc = mosquitto_loop(mosq_, 100, 1);
    if (rc == MOSQ_ERR_SUCCESS) {
      continue;
    }
    if (!loop_running_) {
      break;
    }

    {
      std::lock_guard lock(state_mutex_);
      loop_error_ = rc;
    }
    state_cv_.notify_all();
    NotifyLost(std::string("network loop stopped: ") + mosquitto_strerror(rc));
    break;
  }
}

void MosquittoClient::NotifyLost(const std::string& reason) {
  if (!connected_.exchange(false)) {
    return;
  }
  state_cv_.notify_all();

  DisconnectHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = disconnect_handler_;
  }
  FLEETLINK_LOG_WARN("Broker session lost", {fleetlink::observability::StringField("reason", reason)});
  if (handler) {
    handler(reason);
  }
}

// ------------------------------------------------------------
// Subscriptions / publishing
// ------------------------------------------------------------

void MosquittoClient::Subscribe(const std::string& filter, int qos) {
  std::shared_lock handle(handle_mutex_);
  if (!connected_ || !mosq_) {
    throw ConnectionError(ConnectionError::Kind::kNetwork, "subscribe while not connected: " + filter);
  }
  const int rc = mosquitto_subscribe(mosq_, nullptr, filter.c_str(), qos);
  if (rc != MOSQ_ERR_SUCCESS) {
    throw Classify(rc, "subscribe " + filter);
  }
}

void MosquittoClient::Unsubscribe(const std::string& filter) {
  std::shared_lock handle(handle_mutex_);
  if (!connected_ || !mosq_) {
    return;
  }
  const int rc = mosquitto_unsubscribe(mosq_, nullptr, filter.c_str());
  if (rc != MOSQ_ERR_SUCCESS) {
    FLEETLINK_LOG_WARN("Unsubscribe failed",
                       {fleetlink::observability::StringField("filter", filter), fleetlink::observability::StringField("error", mosquitto_strerror(rc))});
  }
}

void MosquittoClient::Publish(const std::string& topic, const std::string& payload, int qos, std::chrono::milliseconds timeout) {
  // state_mutex_ is taken first so OnPublish cannot run before the mid is registered
  std::unique_lock lock(state_mutex_);
  int              mid = 0;
  {
    // the handle is only pinned for the call itself, never across the ack wait
    std::shared_lock handle(handle_mutex_);
    if (!connected_ || !mosq_) {
      throw PublishError("broker session is not connected");
    }
    const int rc = mosquitto_publish(mosq_, &mid, topic.c_str(), static_cast<int>(payload.size()), payload.data(), qos, false);
    if (rc != MOSQ_ERR_SUCCESS) {
      throw PublishError("publish to " + topic + " failed: " + mosquitto_strerror(rc));
    }
  }
  if (qos == 0) {
    return;
  }

  awaiting_mids_.insert(mid);
  const bool acked = state_cv_.wait_for(lock, timeout, [this, mid] { return acked_mids_.count(mid) > 0 || !connected_; });
  awaiting_mids_.erase(mid);
  const bool confirmed = acked_mids_.erase(mid) > 0;

  if (!acked || !confirmed) {
    throw PublishError("publish to " + topic + " not acknowledged within " + std::to_string(timeout.count()) + "ms");
  }
}

void MosquittoClient::SetMessageHandler(MessageHandler handler) {
  std::lock_guard lock(handler_mutex_);
  message_handler_ = std::move(handler);
}

void MosquittoClient::SetDisconnectHandler(DisconnectHandler handler) {
  std::lock_guard lock(handler_mutex_);
  disconnect_handler_ = std::move(handler);
}

// ------------------------------------------------------------
// libmosquitto callbacks (network thread)
// ------------------------------------------------------------

void MosquittoClient::OnConnect(struct mosquitto*, void* obj, int rc) {
  auto* self = static_cast<MosquittoClient*>(obj);
  {
    std::lock_guard lock(self->state_mutex_);
    self->connack_ = rc;
  }
  self->state_cv_.notify_all();
}

void MosquittoClient::OnDisconnect(struct mosquitto*, void* obj, int rc) {
  auto* self = static_cast<MosquittoClient*>(obj);
  if (rc == 0) {
    return;
  }
  self->NotifyLost(std::string("broker closed the session: ") + mosquitto_strerror(rc));
}

void MosquittoClient::OnPublish(struct mosquitto*, void* obj, int mid) {
  auto* self = static_cast<MosquittoClient*>(obj);
  {
    std::lock_guard lock(self->state_mutex_);
    if (self->awaiting_mids_.count(mid) > 0) {
      self->acked_mids_.insert(mid);
    }
  }
  self->state_cv_.notify_all();
}

void MosquittoClient::OnMessage(struct mosquitto*, void* obj, const struct mosquitto_message* msg) {
  auto* self = static_cast<MosquittoClient*>(obj);

  MessageHandler handler;
  {
    std::lock_guard lock(self->handler_mutex_);
    handler = self->message_handler_;
  }
  if (!handler || !msg->topic) {
    return;
  }
  std::string payload;
  if (msg->payload && msg->payloadlen > 0) {
    payload.assign(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen));
  }
  handler(msg->topic, payload);
}

} // namespace fleetlink::transport
