#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using circulation::factory::Build;
using circulation::runtime::Server;

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
    std::cerr << "Usage: circulation-server <config.yaml> OR circulation-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = circulation::config::ConfigLoader::LoadFromYaml(config_path);

    circulation::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Resolves markers orphaned by a previous process before serving.
    app.maintenance_worker->Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50051" : config.server().bind_address();
    Server            server(bind_address, circulation::runtime::BuildGrpcServices(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CIRCULATION_LOG_INFO("Circulation server started", {circulation::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CIRCULATION_LOG_INFO("Shutting down circulation server");

    server.Stop();
    app.maintenance_worker->Stop();
    circulation::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CIRCULATION_LOG_ERROR("Fatal error", {circulation::observability::StringField("error", e.what())});
    circulation::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
