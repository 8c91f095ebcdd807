// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "borrow.h"
#include "registry.h"
#include "slot_table.h"

#include <kj/memory.h>
#include <kj/refcount.h>

namespace globreg {

// The part of an environment's state the dispatcher needs: its slots and the borrow
// flag guarding them. EnvironmentCell<Extras> adds the application's extras.
class EnvironmentCore : public kj::Refcounted {
 public:
  explicit EnvironmentCore(SlotTable slots) : slots(kj::mv(slots)) {}
  virtual ~EnvironmentCore() noexcept(false) = default;

  SlotTable slots;
  BorrowFlag borrow;
};

// Routes registry notifications to the slot declared for their interface.
//
// ADDED goes to the slot's created(), whatever its kind. REMOVED goes to removed() on
// multi slots only; single globals are assumed to stay for the whole session, so
// their removal is ignored and the old binding stays. Notifications for interfaces
// without a slot are dropped.
//
// The exclusive borrow is held only while the slot is looked up and is released
// before the handler runs, so a handler may use the environment's accessors.
class GlobalDispatcher {
 public:
  GlobalDispatcher(Registry& registry, kj::Own<EnvironmentCore> core);
  GlobalDispatcher(GlobalDispatcher&&) = default;

  void dispatch(const GlobalEvent& event);
  void operator()(const GlobalEvent& event) { dispatch(event); }

 private:
  Registry& registry_;
  kj::Own<EnvironmentCore> core_;
};

}  // namespace globreg
