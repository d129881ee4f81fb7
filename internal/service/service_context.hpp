#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace apphost::service {

class Service {
 public:
  virtual ~Service() = default;

  virtual std::string_view Name() const = 0;
};

/*
  Registry of the application services, shared through the
  ApplicationContext.
*/
class ServiceContext {
 public:
  // Throws util::AlreadyExists for a duplicate name.
  void Register(std::shared_ptr<Service> service);

  // Null when nothing is registered under the name.
  std::shared_ptr<Service> Find(std::string_view name) const;

  // Throws util::NotFound when absent or of another type.
  template <typename T>
  std::shared_ptr<T> Get(std::string_view name) const {
    auto typed = std::dynamic_pointer_cast<T>(Find(name));
    if (!typed) {
      throw util::NotFound("No service '" + std::string(name) + "' of the requested type");
    }
    return typed;
  }

  std::vector<std::string> Names() const;

 private:
  mutable std::shared_mutex                                     mutex_;
  std::map<std::string, std::shared_ptr<Service>, std::less<>> services_;
};

} // namespace apphost::service
