#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using voicecode::observability::IntField;
using voicecode::observability::StringField;

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
    std::cerr << "Usage: session-core <config.yaml> OR session-core --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = voicecode::config::ConfigLoader::LoadFromYaml(config_path);

    voicecode::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto app = voicecode::factory::Build(config);

    for (const auto& entry : app.queue->Snapshot()) {
      VOICECODE_LOG_DEBUG("queued session", {StringField("session_id", entry.session_id), IntField("priority", entry.priority),
                                             voicecode::observability::DoubleField("order", entry.order_key)});
    }

    VOICECODE_LOG_INFO("Session core started", {StringField("config", config_path), IntField("queued_sessions", static_cast<int64_t>(app.queue->Size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VOICECODE_LOG_INFO("Shutting down session core");

    if (app.acks) app.acks->FailAll("session core shutting down");
    if (app.timers) app.timers->Shutdown();
    voicecode::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    VOICECODE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    voicecode::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
