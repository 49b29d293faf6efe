#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <thread>

#include "broker_client.hpp"

// mosquitto types live in the global namespace
struct mosquitto;
struct mosquitto_message;

namespace fleetlink::transport {

/*
  BrokerClient over libmosquitto (MQTT 3.1.1).

  The client owns one network thread that drives mosquitto_loop() while a
  session exists. libmosquitto's own reconnect logic is never used; a lost
  session is reported through the disconnect handler and reconnecting is
  the caller's decision.
*/
class MosquittoClient final : public BrokerClient {
 public:
  MosquittoClient();
  ~MosquittoClient() override;

  MosquittoClient(const MosquittoClient&)            = delete;
  MosquittoClient& operator=(const MosquittoClient&) = delete;

  void Connect(const BrokerOptions& options) override;
  void Abort() override;
  void Disconnect() override;
  bool IsConnected() const override;

  void Subscribe(const std::string& filter, int qos) override;
  void Unsubscribe(const std::string& filter) override;

  void Publish(const std::string& topic, const std::string& payload, int qos, std::chrono::milliseconds timeout) override;

  void SetMessageHandler(MessageHandler handler) override;
  void SetDisconnectHandler(DisconnectHandler handler) override;

 private:
  static void OnConnect(struct mosquitto* mosq, void* obj, int rc);
  static void OnDisconnect(struct mosquitto* mosq, void* obj, int rc);
  static void OnPublish(struct mosquitto* mosq, void* obj, int mid);
  static void OnMessage(struct mosquitto* mosq, void* obj, const struct mosquitto_message* msg);

  void RunLoop();
  void StopLoop();
  void DestroyHandle();
  void NotifyLost(const std::string& reason);

  // connect_mutex_ serializes Connect/Disconnect; handle_mutex_ pins mosq_
  // for publish/subscribe calls made from other threads.
  std::mutex        connect_mutex_;
  std::shared_mutex handle_mutex_;
  struct mosquitto* mosq_ = nullptr;

  std::thread       loop_thread_;
  std::atomic<bool> loop_running_{false};
  std::atomic<bool> connected_{false};

  // guarded by state_mutex_
  std::mutex              state_mutex_;
  std::condition_variable state_cv_;
  std::optional<int>      connack_;
  int                     loop_error_ = 0;
  bool                    aborted_    = false;
  std::set<int>           awaiting_mids_;
  std::set<int>           acked_mids_;

  std::mutex        handler_mutex_;
  MessageHandler    message_handler_;
  DisconnectHandler disconnect_handler_;
};

} // namespace fleetlink::transport
