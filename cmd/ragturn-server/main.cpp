#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/turn_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/turn_service.hpp"

using ragturn::factory::Build;
using ragturn::runtime::Server;

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
    std::cerr << "Usage: ragturn-server <config.yaml> OR ragturn-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ragturn::config::ConfigLoader::LoadFromYaml(config_path);

    ragturn::observability::InitializeTracing(config);
    ragturn::observability::InitializeMetrics(config);
    ragturn::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<ragturn::grpc::TurnServer>(std::make_shared<ragturn::service::TurnService>(app.context)));
    services.push_back(std::make_unique<ragturn::grpc::AdminServer>(std::make_shared<ragturn::service::AdminService>(app.context)));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RAGTURN_LOG_INFO("ragturn started", {ragturn::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RAGTURN_LOG_INFO("Shutting down ragturn");

    server.Shutdown();
    ragturn::observability::ShutdownLogging();
    ragturn::observability::ShutdownMetrics();
    ragturn::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RAGTURN_LOG_ERROR("Fatal error", {ragturn::observability::StringField("error", e.what())});
    ragturn::observability::ShutdownLogging();
    ragturn::observability::ShutdownMetrics();
    ragturn::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
