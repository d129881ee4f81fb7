#include "internal/boot/boot_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/cache_helper.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/global_settings.hpp"
#include "internal/core/application_context.hpp"
#include "internal/core/application_context_access.hpp"
#include "internal/core/context_slot.hpp"
#include "internal/db/database_context.hpp"
#include "internal/resolution/resolution.hpp"
#include "internal/service/runtime_status_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes.hpp"

namespace {

using apphost::boot::BootManager;
using apphost::config::ConfigLoader;
using apphost::config::GlobalSettings;
using apphost::core::ApplicationContext;
using apphost::core::ApplicationContextAccess;
using apphost::core::ContextSlot;
using apphost::resolution::Resolution;
using apphost::runtime::config::RuntimeConfig;
using apphost::service::RuntimeStatusService;
using apphost::testing::ResetProcessState;

RuntimeConfig LoadConfig() {
  return ConfigLoader::LoadFromYamlString(R"(global:
  configuration_status: "8.1.3"
database:
  sqlite:
    path: ":memory:"
web_routing:
  app_url: "https://www.example.com/"
)");
}

void TestFullBootProducesReadyConfiguredContext() {
  ResetProcessState();
  ContextSlot slot;

  bool started_hook  = false;
  bool complete_hook = false;

  BootManager boot(slot);
  boot.Initialize(LoadConfig())
      .Startup([&](ApplicationContext& context) {
        started_hook = true;
        assert(!context.IsReady());
      })
      .Complete([&](ApplicationContext& context) {
        complete_hook = true;
        assert(context.IsReady());
      });

  assert(started_hook && complete_hook);

  auto context = slot.Current();
  assert(context == boot.Context());
  assert(context->IsReady());
  assert(context->WaitForReady(0));
  assert(context->IsConfigured());
  assert(Resolution::IsFrozen());
  assert(context->DatabaseContext()->ProviderName() == "sqlite");
  assert(context->ApplicationCache()->IsEnabled());
  assert(context->ApplicationUrl() == std::optional<std::string>("https://www.example.com"));
  assert(context->Services()->Get<RuntimeStatusService>(RuntimeStatusService::kName));

  context->Dispose();
  assert(context->IsDisposed());
  assert(!Resolution::IsFrozen());
  assert(!GlobalSettings::HasSettings());
}

void TestPhasesMustRunInOrder() {
  ResetProcessState();
  ContextSlot slot;
  BootManager boot(slot);

  bool threw = false;
  try {
    boot.Startup();
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "startup before initialize");

  threw = false;
  try {
    boot.Complete();
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "complete before startup");

  boot.Initialize(LoadConfig());

  threw = false;
  try {
    boot.Initialize(LoadConfig());
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "initialize twice");

  boot.Startup().Complete();

  threw = false;
  try {
    boot.Complete();
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "complete twice");

  slot.Current()->Dispose();
}

void TestExistingContextIsKeptWithoutReplace() {
  ResetProcessState();
  ContextSlot slot;

  auto existing = std::make_shared<ApplicationContext>(apphost::cache::CacheHelper::CreateDefault());
  slot.Ensure(existing, false);

  BootManager boot(slot);
  boot.Initialize(LoadConfig());
  assert(boot.Context() == existing);
  assert(slot.Current() == existing);

  existing->Dispose();
  ResetProcessState();
}

void TestCompletingKeptReadyContextLeavesResolutionOpen() {
  ResetProcessState();
  ContextSlot slot;

  auto existing = slot.Ensure(apphost::db::DatabaseContext::Unconfigured(), std::make_shared<apphost::service::ServiceContext>(),
                              apphost::cache::CacheHelper::CreateDefault(), false);
  ApplicationContextAccess::MarkReady(*existing);

  BootManager boot(slot);
  boot.Initialize(LoadConfig()).Startup();
  assert(boot.Context() == existing);

  bool threw = false;
  try {
    boot.Complete();
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!Resolution::IsFrozen());
  assert(existing->IsReady());

  existing->Dispose();
}

void TestReplaceContextInstallsNewContext() {
  ResetProcessState();
  ContextSlot slot;

  auto existing = std::make_shared<ApplicationContext>(apphost::cache::CacheHelper::CreateDefault());
  slot.Ensure(existing, false);

  auto config = LoadConfig();
  config.mutable_boot()->set_replace_context(true);
  config.mutable_cache()->set_disabled(true);

  BootManager boot(slot);
  boot.Initialize(config).Startup().Complete();

  assert(slot.Current() != existing);
  assert(!slot.Current()->ApplicationCache()->IsEnabled());
  assert(!existing->IsDisposed());

  slot.Current()->Dispose();
}

void TestBootWithoutDatabaseOrVersionIsNotConfigured() {
  ResetProcessState();
  ContextSlot slot;

  BootManager boot(slot);
  boot.Initialize(RuntimeConfig()).Startup().Complete();

  auto context = slot.Current();
  assert(context->IsReady());
  assert(!context->IsConfigured());
  assert(!context->DatabaseContext()->IsDatabaseConfigured());
  assert(!context->ApplicationUrl().has_value());

  context->Dispose();
}

void TestSecondBootFailsWhileResolutionIsFrozen() {
  ResetProcessState();
  ContextSlot slot;

  BootManager first(slot);
  first.Initialize(LoadConfig()).Startup().Complete();

  BootManager second(slot);
  bool        threw = false;
  try {
    second.Initialize(LoadConfig());
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // disposing the first context reopens resolution for a fresh boot
  slot.Current()->Dispose();

  auto config = LoadConfig();
  config.mutable_boot()->set_replace_context(true);
  BootManager third(slot);
  third.Initialize(config).Startup().Complete();
  assert(slot.Current()->IsReady());

  slot.Current()->Dispose();
}

} // namespace

int main() {
  TestFullBootProducesReadyConfiguredContext();
  TestPhasesMustRunInOrder();
  TestExistingContextIsKeptWithoutReplace();
  TestCompletingKeptReadyContextLeavesResolutionOpen();
  TestReplaceContextInstallsNewContext();
  TestBootWithoutDatabaseOrVersionIsNotConfigured();
  TestSecondBootFailsWhileResolutionIsFrozen();

  std::cout << "apphost_unit_boot_manager: pass\n";
  return 0;
}
