#include "cache_helper.hpp"

#include "internal/cache/memory_cache_provider.hpp"
#include "internal/cache/null_cache_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace apphost::cache {

CacheHelper::CacheHelper(std::shared_ptr<CacheProvider> runtime_cache, std::shared_ptr<CacheProvider> static_cache)
    : runtime_cache_(std::move(runtime_cache)),
      static_cache_(std::move(static_cache)) {
  if (!runtime_cache_) throw util::InvalidArgument("runtime_cache must not be null");
  if (!static_cache_) throw util::InvalidArgument("static_cache must not be null");
}

std::shared_ptr<CacheHelper> CacheHelper::CreateDefault() {
  return std::make_shared<CacheHelper>(std::make_shared<MemoryCacheProvider>(), std::make_shared<MemoryCacheProvider>());
}

std::shared_ptr<CacheHelper> CacheHelper::CreateDisabledCache() {
  auto helper      = std::make_shared<CacheHelper>(std::make_shared<NullCacheProvider>(), std::make_shared<NullCacheProvider>());
  helper->enabled_ = false;
  return helper;
}

void CacheHelper::ClearAllCache() {
  runtime_cache_->ClearAllCache();
  static_cache_->ClearAllCache();
  APPHOST_LOG_DEBUG("Application cache cleared");
}

} // namespace apphost::cache
