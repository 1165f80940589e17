#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

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
    std::cerr << "Usage: staging-manager <config.yaml> OR staging-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = staging::config::ConfigLoader::LoadFromYaml(config_path);

    staging::observability::InitializeTracing(config);
    staging::observability::InitializeMetrics(config);
    staging::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = staging::factory::Build(config);

    // Register signal handlers before starting background work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (app.cleanup) {
      app.cleanup->Start();
    } else {
      STAGING_LOG_WARN("Cleanup scheduler disabled by configuration");
    }
    STAGING_LOG_INFO("Staging manager started",
                     {staging::observability::IntField("active_resources", static_cast<int64_t>(app.manager->Index().Size())),
                      staging::observability::StringField("dialect", staging::exec::ToString(app.executor->Dialect()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STAGING_LOG_INFO("Shutting down staging manager");

    if (app.cleanup) {
      app.cleanup->Stop();
    }
    staging::observability::ShutdownLogging();
    staging::observability::ShutdownMetrics();
    staging::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    STAGING_LOG_ERROR("Fatal error", {staging::observability::StringField("error", e.what())});
    staging::observability::ShutdownLogging();
    staging::observability::ShutdownMetrics();
    staging::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
