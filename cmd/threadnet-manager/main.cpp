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

using threadnet::runtime::Server;

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
    std::cerr << "Usage: threadnet-manager <config.yaml> OR threadnet-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = threadnet::config::ConfigLoader::LoadFromYaml(config_path);

    threadnet::observability::InitializeTracing(config);
    threadnet::observability::InitializeMetrics(config);
    threadnet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = threadnet::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    THREADNET_LOG_INFO("Thread network manager started",
                       {threadnet::observability::StringField("bind_address", config.server().bind_address()),
                        threadnet::observability::IntField("port", server.BoundPort()),
                        threadnet::observability::IntField("datasets", static_cast<int64_t>(app.datasets->Size())),
                        threadnet::observability::BoolField("discovery", app.routers != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    THREADNET_LOG_INFO("Shutting down thread network manager");

    // Ends open DiscoverRouters streams so Stop() does not wait out the grace period.
    if (app.routers) app.routers->Shutdown();
    server.Stop();

    threadnet::observability::ShutdownLogging();
    threadnet::observability::ShutdownMetrics();
    threadnet::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    THREADNET_LOG_ERROR("Fatal error", {threadnet::observability::StringField("error", e.what())});
    threadnet::observability::ShutdownLogging();
    threadnet::observability::ShutdownMetrics();
    threadnet::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
