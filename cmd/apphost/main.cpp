#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/boot/boot_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/application_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/runtime_status_service.hpp"
#include "internal/service/service_context.hpp"

using apphost::boot::BootManager;
using apphost::service::RuntimeStatusService;

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
    std::cerr << "Usage: apphost <config.yaml> OR apphost --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = apphost::config::ConfigLoader::LoadFromYaml(config_path);

    apphost::observability::InitializeLogging(config);

    // Register signal handlers before booting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Boot; readiness is observed the way other subsystems observe it
    // ------------------------------------------------------------
    BootManager boot;
    boot.Initialize(config);
    auto context = boot.Context();

    const int ready_timeout_ms = config.boot().ready_timeout_ms() ? static_cast<int>(config.boot().ready_timeout_ms()) : 30000;

    std::thread waiter([context, ready_timeout_ms] {
      if (!context->WaitForReady(ready_timeout_ms)) {
        APPHOST_LOG_WARN("Application not ready", {apphost::observability::IntField("timeout_ms", ready_timeout_ms)});
        return;
      }
      try {
        auto status = context->Services()->Get<RuntimeStatusService>(RuntimeStatusService::kName)->Snapshot(*context);
        APPHOST_LOG_INFO("Application ready", {apphost::observability::StringField("status", RuntimeStatusService::ToJson(status))});
      } catch (const std::exception& e) {
        APPHOST_LOG_ERROR("Runtime status unavailable", {apphost::observability::StringField("error", e.what())});
      }
    });

    try {
      boot.Startup().Complete();
    } catch (...) {
      // disposing releases the waiter
      try {
        context->Dispose();
      } catch (const std::exception& e) {
        APPHOST_LOG_ERROR("Dispose after failed boot failed", {apphost::observability::StringField("error", e.what())});
      }
      waiter.join();
      throw;
    }
    waiter.join();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    APPHOST_LOG_INFO("Shutting down application host");

    context->Dispose();
    apphost::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    APPHOST_LOG_ERROR("Fatal error", {apphost::observability::StringField("error", e.what())});
    apphost::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
