#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fleetlink::runtime::config {
class RuntimeConfig;
}

namespace fleetlink::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"fleetlink"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const fleetlink::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Fleet link instruments.

  No-op unless built with ENABLE_OTEL.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordInboundMessage(std::string_view kind);
  void RecordDecodeFailure(std::string_view reason);
  void RecordReconnectAttempt(bool success);
  void RecordMissionOutcome(std::string_view ack_state);
  void SetVehicleCount(std::string_view link_state, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const fleetlink::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordInboundMessage(std::string_view) {
}

inline void Metrics::RecordDecodeFailure(std::string_view) {
}

inline void Metrics::RecordReconnectAttempt(bool) {
}

inline void Metrics::RecordMissionOutcome(std::string_view) {
}

inline void Metrics::SetVehicleCount(std::string_view, std::uint64_t) {
}
#endif

} // namespace fleetlink::observability
