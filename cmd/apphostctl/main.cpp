#include <iostream>
#include <string>

#include "internal/boot/boot_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/application_context.hpp"
#include "internal/core/context_slot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/runtime_status_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/version.hpp"

using apphost::service::RuntimeStatusService;

static void Usage() {
  std::cout << "Usage:\n"
            << "  apphostctl status <config.yaml>   boot against the config and print the runtime status as JSON\n"
            << "  apphostctl check <config.yaml>    exit 0 when the configured version is current, 3 otherwise\n"
            << "  apphostctl version\n";
}

int main(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) == "version") {
    std::cout << apphost::util::CurrentVersion().ToString(3) << "\n";
    return 0;
  }

  if (argc != 3) {
    Usage();
    return 1;
  }

  const std::string command     = argv[1];
  const std::string config_path = argv[2];

  if (command != "status" && command != "check") {
    Usage();
    return 1;
  }

  try {
    auto config = apphost::config::ConfigLoader::LoadFromYaml(config_path);

    // keep stdout for the command output
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    apphost::observability::InitializeLogging(config);

    apphost::core::ContextSlot slot;
    apphost::boot::BootManager boot(slot);
    boot.Initialize(config).Startup().Complete();

    auto context = boot.Context();
    int  rc      = 0;

    if (command == "status") {
      auto status = context->Services()->Get<RuntimeStatusService>(RuntimeStatusService::kName)->Snapshot(*context);
      std::cout << RuntimeStatusService::ToJson(status) << "\n";
    } else {
      const bool configured = context->IsConfigured();
      std::cout << (configured ? "configured" : "not configured") << " (current " << apphost::util::CurrentVersion().ToString(3) << ", configured "
                << (config.global().configuration_status().empty() ? "<none>" : config.global().configuration_status()) << ")\n";
      rc = configured ? 0 : 3;
    }

    context->Dispose();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "apphostctl: " << e.what() << "\n";
    return 2;
  }
}
