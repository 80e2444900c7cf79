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
static volatile std::sig_atomic_t g_reload  = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReload(int) {
  g_reload = 1;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: vigil-backend <config.yaml> OR vigil-backend --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vigil::config::ConfigLoader::LoadFromYaml(config_path);

    vigil::observability::InitializeTracing(config.observability());
    vigil::observability::InitializeMetrics(config.observability());
    vigil::observability::InitializeLogging(config.logging(), "vigil-backend");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services), vigil::factory::MaxReceiveMessageBytes(config));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleReload);

    server.Start();
    VIGIL_LOG_INFO("Vigil backend started", {vigil::observability::StringField("bind_address", bind_address)});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (!g_reload) continue;
      g_reload = 0;

      // SIGHUP: re-read the file and apply the module list
      try {
        app.ReloadModules(vigil::config::ConfigLoader::LoadFromYaml(config_path));
      } catch (const std::exception& e) {
        VIGIL_LOG_ERROR("Config reload failed; keeping current modules",
                        {vigil::observability::StringField("error", e.what())});
      }
    }

    VIGIL_LOG_INFO("Shutting down vigil backend");

    server.Stop();
    app.Shutdown();
    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    VIGIL_LOG_ERROR("Fatal error", {vigil::observability::StringField("error", e.what())});
    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
