#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/host.hpp"

using bazaar::factory::Build;
using bazaar::runtime::Host;

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
    std::cerr << "Usage: bazaar-economyd <config.yaml> OR bazaar-economyd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = bazaar::config::ConfigLoader::LoadFromYaml(config_path);

    bazaar::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Drive the simulation loop
    // ------------------------------------------------------------
    Host host(app, bazaar::runtime::HostOptionsFrom(config));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    BAZAAR_LOG_INFO("bazaar economy engine started",
                    {bazaar::observability::IntField("api_version", bazaar::economy::v1::kApiVersion)});

    host.Run([] { return g_running != 0; });

    BAZAAR_LOG_INFO("Shutting down bazaar economy engine");

    const auto lost = host.Stop();
    bazaar::observability::ShutdownLogging();
    return lost == 0 ? 0 : 3;
  } catch (const std::exception& e) {
    BAZAAR_LOG_ERROR("Fatal error", {bazaar::observability::StringField("error", e.what())});
    bazaar::observability::ShutdownLogging();
    return 2;
  }
}
