#include "memory_cache_provider.hpp"

#include <mutex>

namespace apphost::cache {

// ------------------------------------------------------------
// Clear
// ------------------------------------------------------------

void MemoryCacheProvider::ClearAllCache() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

void MemoryCacheProvider::ClearCacheItem(const std::string& key) {
  std::unique_lock lock(mutex_);
  cache_.erase(key);
}

void MemoryCacheProvider::ClearCacheByKeySearch(const std::string& key_starts_with) {
  std::unique_lock lock(mutex_);
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (it->first.compare(0, key_starts_with.size(), key_starts_with) == 0)
      it = cache_.erase(it);
    else
      ++it;
  }
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string> MemoryCacheProvider::GetCacheItem(const std::string& key) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(key);
  if (it == cache_.end())
    return std::nullopt;

  return it->second;
}

std::string MemoryCacheProvider::GetCacheItem(const std::string& key, const std::function<std::string()>& factory) {
  if (auto cached = GetCacheItem(key))
    return *cached;

  // factory runs unlocked; when two callers race, the first insert wins
  auto value = factory();

  std::unique_lock lock(mutex_);
  auto [it, inserted] = cache_.emplace(key, std::move(value));
  (void)inserted;
  return it->second;
}

// ------------------------------------------------------------
// Insert
// ------------------------------------------------------------

void MemoryCacheProvider::InsertCacheItem(const std::string& key, std::string value) {
  std::unique_lock lock(mutex_);
  cache_[key] = std::move(value);
}

std::size_t MemoryCacheProvider::Count() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace apphost::cache
