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

using catalog::factory::Build;
using catalog::runtime::Server;

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
    std::cerr << "Usage: catalog-registry <config.yaml> OR catalog-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = catalog::config::ConfigLoader::LoadFromYaml(config_path);

    catalog::observability::InitializeTracing(config);
    catalog::observability::InitializeMetrics(config);
    catalog::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build query backend and services
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
    CATALOG_LOG_INFO("Catalog registry started", {catalog::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CATALOG_LOG_INFO("Shutting down catalog registry");

    server.Stop();
    catalog::observability::ShutdownLogging();
    catalog::observability::ShutdownMetrics();
    catalog::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CATALOG_LOG_ERROR("Fatal error", {catalog::observability::StringField("error", e.what())});
    catalog::observability::ShutdownLogging();
    catalog::observability::ShutdownMetrics();
    catalog::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
