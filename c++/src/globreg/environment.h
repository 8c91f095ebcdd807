// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "borrow.h"
#include "dispatcher.h"
#include "handler.h"
#include "registry.h"
#include "slot_table.h"

#include <kj/array.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/memory.h>
#include <kj/refcount.h>

#include <cstdint>

namespace globreg {

struct NoExtras {};

template <typename Extras = NoExtras>
class Environment;

// Everything an Environment shares between its copies and the dispatcher.
template <typename Extras>
class EnvironmentCell final : public EnvironmentCore {
 public:
  EnvironmentCell(SlotTable slots, Extras extras)
      : EnvironmentCore(kj::mv(slots)), extras(kj::mv(extras)) {}

  Extras extras;
};

// The globals an application wants, and the extra state it keeps beside them.
//
//     Declaration<AppState> declaration(AppState{});
//     declaration.single<Compositor>();
//     declaration.multi<Output>(kj::heap<OutputTracker>());
//     auto env = initEnvironment(registry, kj::mv(declaration));
//
// `single<I>()` and `multi<I>()` without a handler use SimpleGlobal<I> and
// SimpleMultiGlobal<I>.
template <typename Extras = NoExtras>
class Declaration {
 public:
  explicit Declaration(Extras extras = Extras()) : extras_(kj::mv(extras)) {}
  Declaration(Declaration&&) = default;
  KJ_DISALLOW_COPY(Declaration);

  template <typename I>
  Declaration& single(kj::Own<GlobalHandler<I>> handler) {
    slots_.addSingle(I::NAME, kj::mv(handler));
    return *this;
  }

  template <typename I>
  Declaration& single() {
    return single<I>(kj::heap<SimpleGlobal<I>>());
  }

  template <typename I>
  Declaration& multi(kj::Own<MultiGlobalHandler<I>> handler) {
    slots_.addMulti(I::NAME, kj::mv(handler));
    return *this;
  }

  template <typename I>
  Declaration& multi() {
    return multi<I>(kj::heap<SimpleMultiGlobal<I>>());
  }

 private:
  SlotTable slots_;
  Extras extras_;

  template <typename E>
  friend class Environment;
};

// A handle on the globals bound for one registry connection.
//
// Copies are cheap and all observe the same state, which lives as long as the last
// copy (or the registry's listener) does. Only globals named in the Declaration are
// tracked; everything else the server advertises is ignored.
//
// An Environment does not own its Registry: the registry must outlive every copy.
// A moved-from Environment may only be destroyed or assigned to.
template <typename Extras>
class Environment {
 public:
  Environment(const Environment& other) : registry_(other.registry_), cell_(share(other)) {}
  Environment& operator=(const Environment& other) {
    cell_ = share(other);
    registry_ = other.registry_;
    return *this;
  }
  Environment(Environment&&) = default;
  Environment& operator=(Environment&&) = default;

  // Binds every global the declaration names that the registry advertises, running
  // two synchronization rounds so that requests made by handlers in the first round
  // are answered before this returns. Throws if either round fails; no Environment
  // exists in that case.
  static Environment init(Registry& registry, Declaration<Extras>&& declaration);

  // The binding of a single global, or none if the server has not advertised it.
  template <typename I>
  kj::Maybe<Proxy<I>> getGlobal() const {
    BorrowFlag::Shared borrow(cell_->borrow);
    return cell_->slots.template single<I>().get();
  }

  // Like getGlobal(), for globals the application cannot work without: throws naming
  // the interface if the server does not provide it.
  template <typename I>
  Proxy<I> requireGlobal() const {
    auto global = getGlobal<I>();
    KJ_IF_SOME(proxy, global) {
      return kj::mv(proxy);
    }
    KJ_FAIL_REQUIRE("a missing global was required", I::NAME);
  }

  // Every live instance of a multi global, first created first.
  template <typename I>
  kj::Array<Proxy<I>> getAllGlobals() const {
    BorrowFlag::Shared borrow(cell_->borrow);
    return cell_->slots.template multi<I>().getAll();
  }

  // Runs `func` with exclusive access to the extras and returns its result. The
  // environment's accessors cannot be used until `func` returns.
  template <typename Func>
  auto withExtras(Func&& func) const {
    BorrowFlag::Exclusive borrow(cell_->borrow);
    return func(cell_->extras);
  }

  // Every global currently advertised, declared or not.
  kj::Array<GlobalInfo> globals() const { return registry_->globals().list(); }

  // For manual interaction with the registry.
  Registry& registry() const { return *registry_; }

 private:
  Environment(Registry& registry, kj::Own<EnvironmentCell<Extras>> cell)
      : registry_(&registry), cell_(kj::mv(cell)) {}

  static kj::Own<EnvironmentCell<Extras>> share(const Environment& other) {
    KJ_REQUIRE(other.cell_.get() != nullptr, "copy of a moved-from Environment");
    return kj::addRef(*other.cell_);
  }

  Registry* registry_;
  // Accessors are const on the handle; the state behind it is shared and mutable.
  mutable kj::Own<EnvironmentCell<Extras>> cell_;
};

// Runs one of the two initial synchronization rounds, rethrowing a transport failure
// as an initialization error.
void runInitialRoundtrip(Registry& registry, uint32_t round);

template <typename Extras>
Environment<Extras> Environment<Extras>::init(Registry& registry,
                                              Declaration<Extras>&& declaration) {
  auto cell = kj::refcounted<EnvironmentCell<Extras>>(kj::mv(declaration.slots_),
                                                      kj::mv(declaration.extras_));
  kj::Own<EnvironmentCore> core = kj::addRef(*cell);
  registry.setListener(GlobalDispatcher(registry, kj::mv(core)));
  KJ_ON_SCOPE_FAILURE(registry.clearListener());

  // The first round delivers the globals the server knows about. The second lets the
  // handlers that ran during the first see the answers to their own requests.
  runInitialRoundtrip(registry, 1);
  runInitialRoundtrip(registry, 2);

  return Environment(registry, kj::mv(cell));
}

template <typename Extras>
Environment<Extras> initEnvironment(Registry& registry, Declaration<Extras>&& declaration) {
  return Environment<Extras>::init(registry, kj::mv(declaration));
}

}  // namespace globreg
