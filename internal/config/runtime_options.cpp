#include "runtime_options.hpp"

#include "internal/util/errors.hpp"

namespace fleetlink::config {

namespace {

template <typename Duration>
void SetMillis(Duration& target, uint32_t value) {
  if (value != 0) {
    target = std::chrono::milliseconds(value);
  }
}

void SetString(std::string& target, const std::string& value) {
  if (!value.empty()) {
    target = value;
  }
}

} // namespace

RuntimeOptions ResolveOptions(const fleetlink::runtime::config::RuntimeConfig& config) {
  RuntimeOptions options;

  SetString(options.bind_address, config.server().bind_address());
  SetString(options.credential_store_path, config.credentials().store_path());
  SetString(options.credential_key_file, config.credentials().key_file());

  const auto& protocol = config.protocol();
  SetString(options.codec.interface_name, protocol.interface_name());
  SetString(options.codec.major_version, protocol.major_version());
  SetString(options.codec.version, protocol.version());

  options.connection.subscriptions = protocol::FleetSubscriptions(options.codec.interface_name, options.codec.major_version);
  if (protocol.publish_qos() > 2) {
    throw util::ConfigError("protocol.publish_qos must be 1 or 2");
  }
  if (protocol.publish_qos() != 0) {
    options.connection.qos = static_cast<int>(protocol.publish_qos());
  }
  SetMillis(options.connection.connect_timeout, config.connection().connect_timeout_ms());
  SetMillis(options.connection.publish_timeout, config.connection().publish_timeout_ms());

  const auto& telemetry = config.telemetry();
  if (telemetry.window_capacity() != 0) {
    options.telemetry.window_capacity = telemetry.window_capacity();
  }
  SetMillis(options.telemetry.stale_after, telemetry.stale_after_ms());
  SetMillis(options.telemetry.offline_after, telemetry.offline_after_ms());

  const auto& health = config.health();
  SetMillis(options.health.probe_interval, health.probe_interval_ms());
  SetMillis(options.health.freshness_threshold, health.freshness_threshold_ms());
  SetMillis(options.health.backoff_base, health.backoff_base_ms());
  SetMillis(options.health.backoff_max, health.backoff_max_ms());
  if (health.missed_probes_threshold() != 0) {
    options.health.missed_probes_threshold = health.missed_probes_threshold();
  }
  if (health.max_attempts() != 0) {
    options.health.max_attempts = health.max_attempts();
  }

  const auto& mission = config.mission();
  SetMillis(options.mission.ack_timeout, mission.ack_timeout_ms());
  SetString(options.mission.order_prefix, mission.default_order_prefix());
  SetString(options.default_map_id, mission.default_map_id());
  if (mission.max_nodes_per_mission() != 0) {
    options.mission.max_nodes = mission.max_nodes_per_mission();
    options.route.max_nodes   = mission.max_nodes_per_mission();
  }
  if (mission.history_limit() != 0) {
    options.mission.history_limit = mission.history_limit();
  }

  SetMillis(options.idle_timeout, config.session().idle_timeout_ms());

  options.broker_overrides = config.broker();
  return options;
}

} // namespace fleetlink::config
