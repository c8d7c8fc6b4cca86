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
#include "internal/grpc/visit_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using glucolumin::runtime::Server;

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
    std::cerr << "Usage: glucolumin <config.yaml> OR glucolumin --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = glucolumin::config::ConfigLoader::LoadFromYaml(config_path);

    glucolumin::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = glucolumin::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<glucolumin::grpc::VisitServer>(app.visit_service));
    services.push_back(std::make_unique<glucolumin::grpc::AdminServer>(app.admin_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    GLUCOLUMIN_LOG_INFO("GlucoLumin started", {glucolumin::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    GLUCOLUMIN_LOG_INFO("Shutting down GlucoLumin");

    server.Stop();
    app.Stop();
    glucolumin::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    GLUCOLUMIN_LOG_ERROR("Fatal error", {glucolumin::observability::StringField("error", e.what())});
    glucolumin::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
