#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/connection/connection_manager.hpp"
#include "internal/health/health_monitor.hpp"
#include "internal/mission/mission_dispatcher.hpp"
#include "internal/mission/route_parser.hpp"
#include "internal/protocol/protocol_codec.hpp"
#include "internal/telemetry/telemetry_store.hpp"

namespace fleetlink::config {

/*
  Component settings with every zero / empty field of RuntimeConfig replaced
  by its built-in default.
*/
struct RuntimeOptions {
  std::string bind_address{"0.0.0.0:50051"};
  std::string credential_store_path{"fleetlink.db"};
  std::string credential_key_file{"fleetlink.key"};

  protocol::CodecOptions        codec;
  connection::ConnectionOptions connection;
  telemetry::TelemetryOptions   telemetry;
  health::HealthOptions         health;
  mission::DispatcherOptions    mission;
  mission::RouteParseOptions    route;
  std::string                   default_map_id{"map"};

  std::chrono::milliseconds idle_timeout{3'600'000};

  // Non-empty fields overlay the stored broker record.
  fleetlink::runtime::config::BrokerConfig broker_overrides;
};

RuntimeOptions ResolveOptions(const fleetlink::runtime::config::RuntimeConfig& config);

} // namespace fleetlink::config
