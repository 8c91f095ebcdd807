// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "slot_table.h"

namespace globreg {

void SlotTable::addSingle(kj::StringPtr interface, kj::Own<UntypedGlobalHandler> handler) {
  add(interface, kj::mv(handler));
}

void SlotTable::addMulti(kj::StringPtr interface, kj::Own<UntypedMultiGlobalHandler> handler) {
  add(interface, kj::mv(handler));
}

void SlotTable::add(kj::StringPtr interface, Slot slot) {
  bool declared = slots_.find(interface) != kj::none;
  KJ_REQUIRE(!declared, "interface is declared twice", interface);
  slots_.insert(kj::str(interface), kj::mv(slot));
}

kj::Maybe<SlotTable::Slot&> SlotTable::find(kj::StringPtr interface) {
  return slots_.find(interface);
}

}  // namespace globreg
