#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

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
    std::cerr << "Usage: action-dispatcher <config.yaml> OR action-dispatcher --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = actions::config::ConfigLoader::LoadFromYaml(config_path);

    actions::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = actions::factory::Build(config);

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.dispatcher->Start();
    ACTIONS_LOG_INFO("Action dispatcher started", {actions::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ACTIONS_LOG_INFO("Shutting down action dispatcher");

    app.dispatcher->Stop();
    actions::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ACTIONS_LOG_ERROR("Fatal error", {actions::observability::StringField("error", e.what())});
    actions::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
