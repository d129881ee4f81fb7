#pragma once

#include <memory>

#include "internal/cache/cache_provider.hpp"

namespace apphost::cache {

/*
  Application wide cache accessor.

  Runtime cache: entries that may be invalidated while the application runs.
  Static cache: entries that live until the cache is cleared as a whole.
*/
class CacheHelper {
 public:
  CacheHelper(std::shared_ptr<CacheProvider> runtime_cache, std::shared_ptr<CacheProvider> static_cache);

  // In-memory runtime and static caches.
  static std::shared_ptr<CacheHelper> CreateDefault();

  // Caches nothing; factories always run.
  static std::shared_ptr<CacheHelper> CreateDisabledCache();

  CacheProvider& RuntimeCache() const {
    return *runtime_cache_;
  }

  CacheProvider& StaticCache() const {
    return *static_cache_;
  }

  bool IsEnabled() const {
    return enabled_;
  }

  void ClearAllCache();

 private:
  std::shared_ptr<CacheProvider> runtime_cache_;
  std::shared_ptr<CacheProvider> static_cache_;
  bool                           enabled_ = true;
};

} // namespace apphost::cache
