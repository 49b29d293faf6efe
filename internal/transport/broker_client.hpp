#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace fleetlink::transport {

struct BrokerOptions {
  std::string host;
  uint32_t    port    = 1883;
  bool        use_tls = false;
  std::string ca_file;
  std::string username;
  std::string password;
  std::string client_id;
  uint32_t    keepalive_sec = 60;

  std::chrono::milliseconds connect_timeout{10'000};
};

/*
  Publish/subscribe transport seam.

  CONTRACT:

  - Connect() blocks until the broker accepted the session, or throws
    util::ConnectionError classified as DNS / TLS / AUTH / TIMEOUT
    (NETWORK for anything else, CANCELLED after Abort()). It never retries.
  - Abort() may be called from any thread and makes an in-flight Connect()
    return promptly.
  - Publish() throws util::PublishError when not connected or when the
    broker does not acknowledge within `timeout`.
  - The disconnect handler fires once per unexpected session loss; never
    for Disconnect().
  - Handlers are invoked on the transport's network thread.
*/
class BrokerClient {
 public:
  using MessageHandler    = std::function<void(const std::string& topic, const std::string& payload)>;
  using DisconnectHandler = std::function<void(const std::string& reason)>;

  virtual ~BrokerClient() = default;

  virtual void Connect(const BrokerOptions& options) = 0;
  virtual void Abort()                               = 0;
  virtual void Disconnect()                          = 0;
  virtual bool IsConnected() const                   = 0;

  virtual void Subscribe(const std::string& filter, int qos) = 0;
  virtual void Unsubscribe(const std::string& filter)        = 0;

  virtual void Publish(const std::string& topic, const std::string& payload, int qos, std::chrono::milliseconds timeout) = 0;

  virtual void SetMessageHandler(MessageHandler handler)       = 0;
  virtual void SetDisconnectHandler(DisconnectHandler handler) = 0;
};

} // namespace fleetlink::transport
