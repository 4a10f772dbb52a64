#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using datahub::runtime::Server;

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
    std::cerr << "Usage: datahub-server <config.yaml> OR datahub-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = datahub::config::ConfigLoader::LoadFromYaml(config_path);

    datahub::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = datahub::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    for (auto& worker : app.background_workers) worker->Start();
    server.Start();
    DATAHUB_LOG_INFO("Dataset hub started", {datahub::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DATAHUB_LOG_INFO("Shutting down dataset hub");

    server.Stop();
    for (auto& worker : app.background_workers) worker->Stop();
    datahub::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DATAHUB_LOG_ERROR("Fatal error", {datahub::observability::StringField("error", e.what())});
    datahub::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
