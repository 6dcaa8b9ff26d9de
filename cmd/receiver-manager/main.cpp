#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/engine/action_worker.hpp"
#include "internal/engine/local_action_engine.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using receiver::factory::Build;
using receiver::runtime::Server;

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
    std::cerr << "Usage: receiver-manager <config.yaml> OR receiver-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = receiver::config::ConfigLoader::LoadFromYaml(config_path);

    receiver::observability::InitializeTracing(config);
    receiver::observability::InitializeMetrics(config);
    receiver::observability::InitializeLogging(config);

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
    RECEIVER_LOG_INFO("Receiver Manager started", {receiver::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RECEIVER_LOG_INFO("Shutting down receiver manager");

    server.Stop();
    app.action_engine->CancelPending();
    app.background_workers.clear();
    receiver::observability::ShutdownLogging();
    receiver::observability::ShutdownMetrics();
    receiver::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RECEIVER_LOG_ERROR("Fatal error", {receiver::observability::StringField("error", e.what())});
    receiver::observability::ShutdownLogging();
    receiver::observability::ShutdownMetrics();
    receiver::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
