#include "service_context.hpp"

#include <mutex>

namespace apphost::service {

void ServiceContext::Register(std::shared_ptr<Service> service) {
  if (!service) throw util::InvalidArgument("service must not be null");

  std::string name(service->Name());

  std::unique_lock lock(mutex_);
  auto [it, inserted] = services_.emplace(name, std::move(service));
  (void)it;
  if (!inserted) {
    throw util::AlreadyExists("Service '" + name + "' is already registered");
  }
}

std::shared_ptr<Service> ServiceContext::Find(std::string_view name) const {
  std::shared_lock lock(mutex_);
  auto             it = services_.find(name);
  if (it == services_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> ServiceContext::Names() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> names;
  names.reserve(services_.size());
  for (const auto& [name, service] : services_) {
    (void)service;
    names.push_back(name);
  }
  return names;
}

} // namespace apphost::service
