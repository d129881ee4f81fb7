#pragma once

#include "internal/cache/cache_provider.hpp"

namespace apphost::cache {

/*
  Caches nothing. Used when caching is disabled.
*/
class NullCacheProvider final : public CacheProvider {
 public:
  void ClearAllCache() override {
  }
  void ClearCacheItem(const std::string&) override {
  }
  void ClearCacheByKeySearch(const std::string&) override {
  }

  std::optional<std::string> GetCacheItem(const std::string&) const override {
    return std::nullopt;
  }

  std::string GetCacheItem(const std::string&, const std::function<std::string()>& factory) override {
    return factory();
  }

  void InsertCacheItem(const std::string&, std::string) override {
  }

  std::size_t Count() const override {
    return 0;
  }
};

} // namespace apphost::cache
