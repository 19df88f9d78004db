#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/http/http_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reaper/reaper_worker.hpp"
#include "internal/runtime/server.hpp"

using debugpod::factory::Build;
using debugpod::observability::IntField;
using debugpod::observability::StringField;
using debugpod::runtime::Server;

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
    std::cerr << "Usage: debugpod <config.yaml> OR debugpod --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = debugpod::config::ConfigLoader::LoadFromYaml(config_path);

    debugpod::observability::InitializeLogging(config);

    if (::geteuid() == 0 && !config.server().allow_root()) {
      DEBUGPOD_LOG_ERROR("Refusing to run as root; set server.allow_root to override");
      debugpod::observability::ShutdownLogging();
      return 2;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    const auto adopted = app.orchestrator->Recover();
    DEBUGPOD_LOG_INFO("Recovered journaled instances", {IntField("adopted", static_cast<std::int64_t>(adopted))});

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    debugpod::http::HttpServerOptions http_options;
    http_options.bind_address       = config.server().http_bind_address();
    http_options.port               = static_cast<std::uint16_t>(config.server().http_port());
    http_options.threads            = config.server().http_threads();
    http_options.relay_queue_chunks = config.proxy().relay_queue_chunks();

    debugpod::http::HttpServer http_server(app.instance_service, app.proxy, http_options);

    std::unique_ptr<Server> grpc_server;
    if (!config.server().grpc_bind_address().empty()) {
      grpc_server = std::make_unique<Server>(config.server().grpc_bind_address(), std::move(app.grpc_services));
    }

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    http_server.Start();
    if (grpc_server) {
      grpc_server->Start();
    }
    if (app.reaper_worker) {
      app.reaper_worker->Start();
    }

    DEBUGPOD_LOG_INFO("debugpod started", {StringField("http_bind_address", http_options.bind_address),
                                           IntField("http_port", http_server.BoundPort()),
                                           StringField("grpc_bind_address", config.server().grpc_bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DEBUGPOD_LOG_INFO("Shutting down debugpod");

    if (app.reaper_worker) {
      app.reaper_worker->Stop();
    }
    if (grpc_server) {
      grpc_server->Stop();
    }
    http_server.Stop();
    debugpod::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    debugpod::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
