// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "dispatcher.h"

#include "debug.h"

namespace globreg {

GlobalDispatcher::GlobalDispatcher(Registry& registry, kj::Own<EnvironmentCore> core)
    : registry_(registry), core_(kj::mv(core)) {}

void GlobalDispatcher::dispatch(const GlobalEvent& event) {
  kj::Maybe<SlotTable::Slot&> target = [&]() {
    BorrowFlag::Exclusive borrow(core_->borrow);
    return core_->slots.find(event.interface);
  }();

  KJ_IF_SOME(slot, target) {
    KJ_SWITCH_ONEOF(slot) {
      KJ_CASE_ONEOF(single, kj::Own<UntypedGlobalHandler>) {
        if (event.kind == GlobalEvent::Kind::ADDED) {
          single->created(registry_, event.id, event.version);
        } else {
          debugLog("dispatch",
                   kj::str("ignoring removal of single global ", event.interface, " ",
                           event.id, "; its binding is kept"));
        }
      }
      KJ_CASE_ONEOF(multi, kj::Own<UntypedMultiGlobalHandler>) {
        if (event.kind == GlobalEvent::Kind::ADDED) {
          multi->created(registry_, event.id, event.version);
        } else {
          multi->removed(event.id);
        }
      }
    }
  } else {
    debugLog("dispatch", kj::str("no slot for ", event.interface, " ", event.id));
  }
}

}  // namespace globreg
