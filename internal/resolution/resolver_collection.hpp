#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace apphost::resolution {

class ResolverBase {
 public:
  virtual ~ResolverBase() = default;

  virtual const std::string& Name() const = 0;

  // Drops whatever the resolver currently holds.
  virtual void ResetResolver() = 0;
};

/*
  Process-wide registry of live resolvers.

  ResetAll() resets every registered resolver and empties the registry;
  resolvers register themselves again the next time they are configured.
*/
class ResolverCollection {
 public:
  // Adding a resolver that is already registered is a no-op.
  static void Add(std::shared_ptr<ResolverBase> resolver);

  static std::size_t Count();

  static void ResetAll();
};

} // namespace apphost::resolution
