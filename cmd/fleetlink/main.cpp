#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/fleet_runtime.hpp"
#include "internal/runtime/server.hpp"

using fleetlink::factory::Build;
using fleetlink::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fleetlink <config.yaml> OR fleetlink --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleetlink::config::ConfigLoader::LoadFromYaml(config_path);

    fleetlink::observability::InitializeMetrics(config);
    fleetlink::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto        app          = Build(config);
    const auto& bind_address = app.runtime->Options().bind_address;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FLEETLINK_LOG_INFO("Fleet link started", {fleetlink::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEETLINK_LOG_INFO("Shutting down fleet link");

    server.Stop();
    app.runtime->Shutdown();
    fleetlink::observability::ShutdownLogging();
    fleetlink::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    FLEETLINK_LOG_ERROR("Fatal error", {fleetlink::observability::StringField("error", e.what())});
    fleetlink::observability::ShutdownLogging();
    fleetlink::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
