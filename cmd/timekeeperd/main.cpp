#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/match.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using timekeeper::runtime::Server;

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
    std::cerr << "Usage: timekeeperd <config.yaml> OR timekeeperd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = timekeeper::config::ConfigLoader::LoadFromYaml(config_path);

    timekeeper::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = timekeeper::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TIMEKEEPER_LOG_INFO("timekeeperd started",
                        {timekeeper::observability::StringField("bind_address", config.server().bind_address()),
                         timekeeper::observability::ClockField("match_duration", timekeeper::model::kMatchDurationSeconds),
                         timekeeper::observability::IntField("accuracy_threshold_seconds", config.timer().accuracy_threshold_seconds())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    TIMEKEEPER_LOG_INFO("timekeeperd shutting down");

    server.Stop();
    timekeeper::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TIMEKEEPER_LOG_ERROR("Fatal error", {timekeeper::observability::StringField("error", e.what())});
    timekeeper::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
