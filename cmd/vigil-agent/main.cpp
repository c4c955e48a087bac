#include <atomic>
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

using vigil::factory::Build;
using vigil::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;
static std::atomic<bool>          g_fatal{false};

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
    std::cerr << "Usage: vigil-agent <config.yaml> OR vigil-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vigil::config::ConfigLoader::Load(config_path);

    vigil::observability::InitializeTracing(config);
    vigil::observability::InitializeMetrics(config);
    vigil::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config, [](const std::string&) { g_fatal = true; });

    // ------------------------------------------------------------
    // Start pipeline and server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    VIGIL_LOG_INFO("vigil agent started", {vigil::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running && !g_fatal) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    if (g_fatal) {
      VIGIL_LOG_CRITICAL("Shutting down vigil agent after fatal store condition");
    } else {
      VIGIL_LOG_INFO("Shutting down vigil agent");
    }

    server.Stop();
    app.Stop();

    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
    return g_fatal ? 3 : 0;
  } catch (const std::exception& e) {
    VIGIL_LOG_ERROR("Fatal error", {vigil::observability::StringField("error", e.what())});
    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
    return 2;
  }
}
