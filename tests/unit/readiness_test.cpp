#include "internal/core/application_context.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/cache/cache_helper.hpp"
#include "internal/core/application_context_access.hpp"
#include "internal/core/ready_signal.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes.hpp"

namespace {

using apphost::cache::CacheHelper;
using apphost::core::ApplicationContext;
using apphost::core::ApplicationContextAccess;
using apphost::core::ReadySignal;
using apphost::testing::ResetProcessState;

void TestSignalStaysSet() {
  ReadySignal signal;
  assert(!signal.IsSet());
  assert(!signal.Wait(std::chrono::milliseconds(0)));

  signal.Set();
  signal.Set();
  assert(signal.IsSet());
  assert(signal.Wait(std::chrono::milliseconds(0)));
  assert(signal.Wait(std::chrono::milliseconds(-1)));
}

void TestAbandonedSignalReturnsFalseImmediately() {
  ReadySignal signal;
  signal.Abandon();

  const auto start = std::chrono::steady_clock::now();
  assert(!signal.Wait(std::chrono::milliseconds(-1)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

void TestWaitTimesOutWhenNeverReady() {
  ApplicationContext context(CacheHelper::CreateDefault());

  const auto start = std::chrono::steady_clock::now();
  assert(!context.WaitForReady(50));
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(50));
  assert(!context.IsReady());
}

void TestWaitAfterReadyReturnsImmediately() {
  ApplicationContext context(CacheHelper::CreateDefault());
  ApplicationContextAccess::MarkReady(context);

  assert(context.IsReady());
  assert(context.WaitForReady(0));
  assert(context.WaitForReady(-1));
}

void TestMarkReadyTwiceThrows() {
  ApplicationContext context(CacheHelper::CreateDefault());
  ApplicationContextAccess::MarkReady(context);

  bool threw = false;
  try {
    ApplicationContextAccess::MarkReady(context);
  } catch (const apphost::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "readiness is one-shot");
  assert(context.IsReady());
}

void TestConcurrentWaitersAllWake() {
  ApplicationContext context(CacheHelper::CreateDefault());

  constexpr int            kWaiters = 8;
  std::atomic<int>         woke{0};
  std::vector<std::thread> waiters;
  for (int i = 0; i < kWaiters; ++i) {
    waiters.emplace_back([&] {
      if (context.WaitForReady(10000)) ++woke;
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ApplicationContextAccess::MarkReady(context);

  for (auto& t : waiters) t.join();
  assert(woke == kWaiters);
}

void TestDisposeWakesBlockedWaiters() {
  ResetProcessState();

  ApplicationContext context(CacheHelper::CreateDefault());

  std::atomic<bool> returned{false};
  std::atomic<bool> result{true};
  std::thread       waiter([&] {
    result   = context.WaitForReady(-1);
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!returned);

  context.Dispose();
  waiter.join();

  assert(returned);
  assert(!result);
  assert(!context.WaitForReady(0));
}

void TestReadyContextReportsNotReadyOnceDisposed() {
  ResetProcessState();

  ApplicationContext context(CacheHelper::CreateDefault());
  ApplicationContextAccess::MarkReady(context);
  context.Dispose();

  assert(!context.IsReady());
  assert(!context.WaitForReady(0));
}

} // namespace

int main() {
  TestSignalStaysSet();
  TestAbandonedSignalReturnsFalseImmediately();
  TestWaitTimesOutWhenNeverReady();
  TestWaitAfterReadyReturnsImmediately();
  TestMarkReadyTwiceThrows();
  TestConcurrentWaitersAllWake();
  TestDisposeWakesBlockedWaiters();
  TestReadyContextReportsNotReadyOnceDisposed();

  std::cout << "apphost_unit_readiness: pass\n";
  return 0;
}
