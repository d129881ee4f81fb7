#pragma once

#include <memory>

namespace apphost::cache {
class CacheHelper;
}
namespace apphost::db {
class DatabaseContext;
}
namespace apphost::service {
class ServiceContext;
}

namespace apphost::core {

class ApplicationContext;

/*
  Holds the current ApplicationContext.

  NOT thread safe. Install and replace happen during startup (or test
  setup) from a single thread; reads take no lock. Tests construct their
  own slot instead of going through GlobalContextSlot().

  Replacing a context does not dispose the previous one.
*/
class ContextSlot {
 public:
  // Null until the first install.
  std::shared_ptr<ApplicationContext> Current() const {
    return current_;
  }

  // Returns the now-current context. Throws util::InvalidArgument when a null
  // context would be installed; a kept context ignores the argument.
  std::shared_ptr<ApplicationContext> Ensure(std::shared_ptr<ApplicationContext> context, bool replace_context);

  // Builds a context from the handles, then applies the same policy.
  std::shared_ptr<ApplicationContext> Ensure(std::shared_ptr<db::DatabaseContext> database_context, std::shared_ptr<service::ServiceContext> services,
                                             std::shared_ptr<cache::CacheHelper> cache, bool replace_context);

  void Clear() {
    current_.reset();
  }

 private:
  std::shared_ptr<ApplicationContext> current_;
};

// The process-wide slot behind ApplicationContext::Current().
ContextSlot& GlobalContextSlot();

} // namespace apphost::core
