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

using rulegraph::runtime::Server;

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
    std::cerr << "Usage: rulegraph-server <config.yaml> OR rulegraph-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rulegraph::config::ConfigLoader::LoadFromYaml(config_path);

    rulegraph::observability::InitializeTracing(config);
    rulegraph::observability::InitializeMetrics(config);
    rulegraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (store, cache, graph, services)
    // ------------------------------------------------------------
    auto app = rulegraph::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), app.grpc_services);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RULEGRAPH_LOG_INFO("rulegraph started", {rulegraph::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RULEGRAPH_LOG_INFO("Shutting down rulegraph");

    server.Stop();
    rulegraph::observability::ShutdownLogging();
    rulegraph::observability::ShutdownMetrics();
    rulegraph::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_ERROR("Fatal error", {rulegraph::observability::StringField("error", e.what())});
    rulegraph::observability::ShutdownLogging();
    rulegraph::observability::ShutdownMetrics();
    rulegraph::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
