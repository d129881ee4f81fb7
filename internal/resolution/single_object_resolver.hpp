#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "internal/resolution/resolution.hpp"
#include "internal/resolution/resolver_collection.hpp"
#include "internal/util/errors.hpp"

namespace apphost::resolution {

/*
  Resolves a single object.

  The value can only be configured while resolution is open. Reading
  requires resolution to be frozen unless the resolver was created with
  can_read_unfrozen. Create resolvers with std::make_shared; SetValue
  registers the resolver with ResolverCollection so a reset clears it.
*/
template <typename T>
class SingleObjectResolver : public ResolverBase, public std::enable_shared_from_this<SingleObjectResolver<T>> {
 public:
  explicit SingleObjectResolver(std::string name, bool can_be_null = false, bool can_read_unfrozen = false)
      : name_(std::move(name)), can_be_null_(can_be_null), can_read_unfrozen_(can_read_unfrozen) {
  }

  const std::string& Name() const override {
    return name_;
  }

  void SetValue(std::shared_ptr<T> value) {
    Resolution::EnsureIsNotFrozen();
    if (!value && !can_be_null_) {
      throw util::InvalidArgument(name_ + " does not accept a null value");
    }
    {
      std::unique_lock lock(mutex_);
      value_ = std::move(value);
    }
    ResolverCollection::Add(this->shared_from_this());
  }

  std::shared_ptr<T> Value() const {
    if (!can_read_unfrozen_) {
      Resolution::EnsureIsFrozen();
    }

    std::shared_lock lock(mutex_);
    if (!value_ && !can_be_null_) {
      throw util::NotSet(name_ + " has no value");
    }
    return value_;
  }

  bool HasValue() const {
    std::shared_lock lock(mutex_);
    return value_ != nullptr;
  }

  void ResetResolver() override {
    std::unique_lock lock(mutex_);
    value_.reset();
  }

 private:
  const std::string name_;
  const bool        can_be_null_;
  const bool        can_read_unfrozen_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<T>        value_;
};

} // namespace apphost::resolution
