#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using tending::runtime::Server;

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
    std::cerr << "Usage: tending-manager <config.yaml> OR tending-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tending::config::ConfigLoader::LoadFromYaml(config_path);

    tending::observability::InitializeTracing(config);
    tending::observability::InitializeMetrics(config);
    tending::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = tending::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TENDING_LOG_INFO("Tending manager started", {tending::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TENDING_LOG_INFO("Shutting down tending manager");

    server.Stop();
    tending::observability::ShutdownLogging();
    tending::observability::ShutdownMetrics();
    tending::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TENDING_LOG_ERROR("Fatal error", {tending::observability::StringField("error", e.what())});
    tending::observability::ShutdownLogging();
    tending::observability::ShutdownMetrics();
    tending::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
