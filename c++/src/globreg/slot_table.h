// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "handler.h"

#include <kj/debug.h>
#include <kj/map.h>
#include <kj/one-of.h>
#include <kj/string.h>

#include <cstddef>

namespace globreg {

// Maps each declared interface name to the handler responsible for it. Filled once
// while the environment is declared and never changed afterwards.
class SlotTable {
 public:
  using Slot = kj::OneOf<kj::Own<UntypedGlobalHandler>, kj::Own<UntypedMultiGlobalHandler>>;

  SlotTable() = default;
  SlotTable(SlotTable&&) = default;
  SlotTable& operator=(SlotTable&&) = default;
  KJ_DISALLOW_COPY(SlotTable);

  // Each interface name may be declared once.
  void addSingle(kj::StringPtr interface, kj::Own<UntypedGlobalHandler> handler);
  void addMulti(kj::StringPtr interface, kj::Own<UntypedMultiGlobalHandler> handler);

  kj::Maybe<Slot&> find(kj::StringPtr interface);
  size_t size() const { return slots_.size(); }

  // Typed lookups. Asking for an interface that was not declared with the matching
  // kind is a programming error.
  template <typename I>
  GlobalHandler<I>& single();
  template <typename I>
  MultiGlobalHandler<I>& multi();

 private:
  void add(kj::StringPtr interface, Slot slot);

  kj::HashMap<kj::String, Slot> slots_;
};

template <typename I>
GlobalHandler<I>& SlotTable::single() {
  KJ_IF_SOME(slot, find(I::NAME)) {
    KJ_REQUIRE(slot.is<kj::Own<UntypedGlobalHandler>>(),
               "interface is declared as a multi global, not a single one", I::NAME);
    return kj::downcast<GlobalHandler<I>>(*slot.get<kj::Own<UntypedGlobalHandler>>());
  }
  KJ_FAIL_REQUIRE("interface is not declared in this environment", I::NAME);
}

template <typename I>
MultiGlobalHandler<I>& SlotTable::multi() {
  KJ_IF_SOME(slot, find(I::NAME)) {
    KJ_REQUIRE(slot.is<kj::Own<UntypedMultiGlobalHandler>>(),
               "interface is declared as a single global, not a multi one", I::NAME);
    return kj::downcast<MultiGlobalHandler<I>>(
        *slot.get<kj::Own<UntypedMultiGlobalHandler>>());
  }
  KJ_FAIL_REQUIRE("interface is not declared in this environment", I::NAME);
}

}  // namespace globreg
