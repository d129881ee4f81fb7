#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace apphost::cache {

/*
  Key/value cache used application wide.

  Values are opaque strings; callers own their serialization.
*/
class CacheProvider {
 public:
  virtual ~CacheProvider() = default;

  virtual void ClearAllCache() = 0;
  virtual void ClearCacheItem(const std::string& key) = 0;
  virtual void ClearCacheByKeySearch(const std::string& key_starts_with) = 0;

  virtual std::optional<std::string> GetCacheItem(const std::string& key) const = 0;

  // Returns the cached value, or runs the factory and caches its result.
  virtual std::string GetCacheItem(const std::string& key, const std::function<std::string()>& factory) = 0;

  virtual void InsertCacheItem(const std::string& key, std::string value) = 0;

  virtual std::size_t Count() const = 0;
};

} // namespace apphost::cache
