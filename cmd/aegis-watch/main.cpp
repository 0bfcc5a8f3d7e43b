#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
    std::cerr << "Usage: aegis-watch <config.yaml> OR aegis-watch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = aegis::config::ConfigLoader::LoadFromYaml(config_path);

    aegis::observability::InitializeLogging(config);
    aegis::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = aegis::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    AEGIS_LOG_INFO("Shutting down aegis-watch");

    app.Stop();
    aegis::observability::ShutdownMetrics();
    aegis::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    AEGIS_LOG_ERROR("Fatal error", {aegis::observability::StringField("error", e.what())});
    aegis::observability::ShutdownMetrics();
    aegis::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
