#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "internal/cache/cache_provider.hpp"

namespace apphost::cache {

class MemoryCacheProvider final : public CacheProvider {
 public:
  void ClearAllCache() override;
  void ClearCacheItem(const std::string& key) override;
  void ClearCacheByKeySearch(const std::string& key_starts_with) override;

  std::optional<std::string> GetCacheItem(const std::string& key) const override;
  std::string                GetCacheItem(const std::string& key, const std::function<std::string()>& factory) override;

  void InsertCacheItem(const std::string& key, std::string value) override;

  std::size_t Count() const override;

 private:
  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> cache_;
};

} // namespace apphost::cache
