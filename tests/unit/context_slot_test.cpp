#include "internal/core/context_slot.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/cache/cache_helper.hpp"
#include "internal/core/application_context.hpp"
#include "internal/db/database_context.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using apphost::cache::CacheHelper;
using apphost::core::ApplicationContext;
using apphost::core::ContextSlot;
using apphost::core::GlobalContextSlot;
using apphost::db::DatabaseContext;
using apphost::service::ServiceContext;

std::shared_ptr<ApplicationContext> MakeContext() {
  return std::make_shared<ApplicationContext>(CacheHelper::CreateDefault());
}

void TestFirstEnsureInstallsRegardlessOfReplaceFlag() {
  ContextSlot slot;
  assert(!slot.Current());

  auto a = MakeContext();
  assert(slot.Ensure(a, false) == a);
  assert(slot.Current() == a);
}

void TestEnsureKeepsExistingWithoutReplace() {
  ContextSlot slot;
  auto        a = MakeContext();
  auto        b = MakeContext();

  slot.Ensure(a, false);
  assert(slot.Ensure(b, false) == a);
  assert(slot.Current() == a);
  assert(!b->IsDisposed());
}

void TestEnsureReplacesWhenAsked() {
  ContextSlot slot;
  auto        a = MakeContext();
  auto        b = MakeContext();
  auto        c = MakeContext();

  slot.Ensure(a, false);
  assert(slot.Ensure(b, true) == b);
  assert(slot.Ensure(c, false) == b);
  assert(slot.Current() == b);

  // the replaced context is left to its owner
  assert(!a->IsDisposed());
}

void TestEnsureRejectsNullContext() {
  ContextSlot slot;

  bool threw = false;
  try {
    slot.Ensure(std::shared_ptr<ApplicationContext>{}, true);
  } catch (const apphost::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!slot.Current());
}

void TestNullCandidateIsIgnoredWhenExistingIsKept() {
  ContextSlot slot;
  auto        a = MakeContext();
  slot.Ensure(a, false);

  assert(slot.Ensure(std::shared_ptr<ApplicationContext>{}, false) == a);
  assert(slot.Current() == a);

  bool threw = false;
  try {
    slot.Ensure(std::shared_ptr<ApplicationContext>{}, true);
  } catch (const apphost::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "a null context must never be installed");
  assert(slot.Current() == a);
}

void TestEnsureFromHandlesBuildsFullContext() {
  ContextSlot slot;

  auto database_context = DatabaseContext::Unconfigured();
  auto services         = std::make_shared<ServiceContext>();
  auto cache            = CacheHelper::CreateDefault();

  auto installed = slot.Ensure(database_context, services, cache, false);
  assert(installed == slot.Current());
  assert(installed->DatabaseContext() == database_context);
  assert(installed->Services() == services);
  assert(installed->ApplicationCache() == cache);

  auto kept = slot.Ensure(DatabaseContext::Unconfigured(), std::make_shared<ServiceContext>(), CacheHelper::CreateDefault(), false);
  assert(kept == installed);
}

void TestEnsureFromHandlesRejectsNullsBeforeTheSlotIsTouched() {
  ContextSlot slot;
  auto        a = MakeContext();
  slot.Ensure(a, false);

  bool threw = false;
  try {
    slot.Ensure(DatabaseContext::Unconfigured(), nullptr, CacheHelper::CreateDefault(), true);
  } catch (const apphost::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(slot.Current() == a);
}

void TestGlobalSlotBacksApplicationContextCurrent() {
  GlobalContextSlot().Clear();
  assert(!ApplicationContext::Current());

  auto a = MakeContext();
  auto b = MakeContext();

  assert(ApplicationContext::EnsureContext(a, false) == a);
  assert(ApplicationContext::Current() == a);
  assert(ApplicationContext::EnsureContext(b, false) == a);
  assert(ApplicationContext::EnsureContext(b, true) == b);
  assert(ApplicationContext::Current() == b);

  auto c = ApplicationContext::EnsureContext(DatabaseContext::Unconfigured(), std::make_shared<ServiceContext>(),
                                             CacheHelper::CreateDefault(), true);
  assert(ApplicationContext::Current() == c);
  assert(c != b);

  GlobalContextSlot().Clear();
  assert(!ApplicationContext::Current());
}

} // namespace

int main() {
  TestFirstEnsureInstallsRegardlessOfReplaceFlag();
  TestEnsureKeepsExistingWithoutReplace();
  TestEnsureReplacesWhenAsked();
  TestEnsureRejectsNullContext();
  TestNullCandidateIsIgnoredWhenExistingIsKept();
  TestEnsureFromHandlesBuildsFullContext();
  TestEnsureFromHandlesRejectsNullsBeforeTheSlotIsTouched();
  TestGlobalSlotBacksApplicationContextCurrent();

  std::cout << "apphost_unit_context_slot: pass\n";
  return 0;
}
