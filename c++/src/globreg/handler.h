// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "proxy.h"
#include "registry.h"

#include <kj/array.h>
#include <kj/common.h>

#include <cstdint>
#include <vector>

namespace globreg {

// Handlers for "single" globals: capabilities of the server, generally advertised
// once at startup and never retracted (a compositor, a shared-memory allocator).
class UntypedGlobalHandler {
 public:
  virtual ~UntypedGlobalHandler() noexcept(false) = default;

  // The global was advertised with `id` and `version`. Binds it, replacing any
  // earlier binding.
  virtual void created(Registry& registry, uint32_t id, uint32_t version) = 0;
};

template <typename I>
class GlobalHandler : public UntypedGlobalHandler {
 public:
  // The most recent binding, or none if the global was never advertised.
  virtual kj::Maybe<Proxy<I>> get() const = 0;
};

// Handlers for "multi" globals: resources that come and go during the session and
// can exist several times at once (outputs, seats).
class UntypedMultiGlobalHandler {
 public:
  virtual ~UntypedMultiGlobalHandler() noexcept(false) = default;

  // A new instance was advertised. An id that is already present is replaced, not
  // duplicated.
  virtual void created(Registry& registry, uint32_t id, uint32_t version) = 0;

  // The instance with `id` was retracted. Unknown ids are ignored.
  virtual void removed(uint32_t id) = 0;
};

template <typename I>
class MultiGlobalHandler : public UntypedMultiGlobalHandler {
 public:
  // Every live instance, first created first.
  virtual kj::Array<Proxy<I>> getAll() const = 0;
};

// Binds the global when it is advertised and does nothing more. Suits globals that
// emit no events of their own.
template <typename I>
class SimpleGlobal final : public GlobalHandler<I> {
 public:
  SimpleGlobal() = default;

  void created(Registry& registry, uint32_t id, uint32_t version) override {
    global_ = Proxy<I>(registry.bind(I::NAME, id, kj::min(version, I::VERSION)));
  }

  kj::Maybe<Proxy<I>> get() const override { return global_; }

 private:
  kj::Maybe<Proxy<I>> global_;
};

// Keeps every live instance of a multi global, bound at the highest version both
// sides support.
template <typename I>
class SimpleMultiGlobal final : public MultiGlobalHandler<I> {
 public:
  SimpleMultiGlobal() = default;

  void created(Registry& registry, uint32_t id, uint32_t version) override {
    Proxy<I> proxy(registry.bind(I::NAME, id, kj::min(version, I::VERSION)));
    for (auto& entry : instances_) {
      if (entry.id == id) {
        entry.proxy = kj::mv(proxy);
        return;
      }
    }
    instances_.push_back(Entry{id, kj::mv(proxy)});
  }

  void removed(uint32_t id) override {
    for (auto it = instances_.begin(); it != instances_.end(); ++it) {
      if (it->id == id) {
        instances_.erase(it);
        return;
      }
    }
  }

  kj::Array<Proxy<I>> getAll() const override {
    auto builder = kj::heapArrayBuilder<Proxy<I>>(instances_.size());
    for (auto& entry : instances_) {
      builder.add(entry.proxy);
    }
    return builder.finish();
  }

 private:
  struct Entry {
    uint32_t id;
    Proxy<I> proxy;
  };

  std::vector<Entry> instances_;
};

}  // namespace globreg
