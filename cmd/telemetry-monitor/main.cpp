#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using telemetry::factory::Build;
using telemetry::runtime::Server;

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
    std::cerr << "Usage: telemetry-monitor <config.yaml> OR telemetry-monitor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = telemetry::config::ConfigLoader::LoadFromYaml(config_path);

    telemetry::observability::InitializeMetrics(config);
    telemetry::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TELEMETRY_LOG_INFO("Telemetry monitor started", {telemetry::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    TELEMETRY_LOG_INFO("Shutting down telemetry monitor");

    server.Stop();
    app.Shutdown();
    telemetry::observability::ShutdownLogging();
    telemetry::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    TELEMETRY_LOG_ERROR("Fatal error", {telemetry::observability::StringField("error", e.what())});
    telemetry::observability::ShutdownLogging();
    telemetry::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
