#include "context_slot.hpp"

#include "internal/core/application_context.hpp"
#include "internal/util/errors.hpp"

namespace apphost::core {

std::shared_ptr<ApplicationContext> ContextSlot::Ensure(std::shared_ptr<ApplicationContext> context, bool replace_context) {
  if (current_ && !replace_context) {
    return current_;
  }

  if (!context) {
    throw util::InvalidArgument("context must not be null");
  }

  current_ = std::move(context);
  return current_;
}

std::shared_ptr<ApplicationContext> ContextSlot::Ensure(std::shared_ptr<db::DatabaseContext>     database_context,
                                                        std::shared_ptr<service::ServiceContext> services,
                                                        std::shared_ptr<cache::CacheHelper> cache, bool replace_context) {
  auto context = std::make_shared<ApplicationContext>(std::move(database_context), std::move(services), std::move(cache));
  return Ensure(std::move(context), replace_context);
}

ContextSlot& GlobalContextSlot() {
  static ContextSlot slot;
  return slot;
}

} // namespace apphost::core
