#include "resolver_collection.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

#include "internal/observability/logging.hpp"

namespace apphost::resolution {
namespace {

std::mutex& RegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::vector<std::shared_ptr<ResolverBase>>& Registry() {
  static std::vector<std::shared_ptr<ResolverBase>> resolvers;
  return resolvers;
}

} // namespace

void ResolverCollection::Add(std::shared_ptr<ResolverBase> resolver) {
  if (!resolver) return;

  std::lock_guard lock(RegistryMutex());
  auto&           resolvers = Registry();
  if (std::find(resolvers.begin(), resolvers.end(), resolver) != resolvers.end()) return;
  resolvers.push_back(std::move(resolver));
}

std::size_t ResolverCollection::Count() {
  std::lock_guard lock(RegistryMutex());
  return Registry().size();
}

void ResolverCollection::ResetAll() {
  std::vector<std::shared_ptr<ResolverBase>> resolvers;
  {
    std::lock_guard lock(RegistryMutex());
    resolvers.swap(Registry());
  }

  // reset outside the registry lock, a resolver may log or touch other resolvers
  for (const auto& resolver : resolvers) {
    resolver->ResetResolver();
  }

  APPHOST_LOG_DEBUG("Resolvers reset", {observability::IntField("count", static_cast<std::int64_t>(resolvers.size()))});
}

} // namespace apphost::resolution
