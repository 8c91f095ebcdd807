// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <globreg/slot_table.h>

#include <kj/test.h>

#include "test_interfaces.h"

namespace globreg {
namespace {

using test::Compositor;
using test::Output;
using test::Seat;

KJ_TEST("SlotTable keeps one slot per interface") {
  SlotTable slots;
  slots.addSingle(Compositor::NAME, kj::heap<SimpleGlobal<Compositor>>());
  slots.addMulti(Output::NAME, kj::heap<SimpleMultiGlobal<Output>>());
  KJ_EXPECT(slots.size() == 2);

  KJ_EXPECT_THROW_MESSAGE("interface is declared twice",
                          slots.addMulti(Compositor::NAME,
                                         kj::heap<SimpleMultiGlobal<Output>>()));
  KJ_EXPECT(slots.size() == 2);
}

KJ_TEST("SlotTable finds slots by name") {
  SlotTable slots;
  slots.addSingle(Compositor::NAME, kj::heap<SimpleGlobal<Compositor>>());
  slots.addMulti(Output::NAME, kj::heap<SimpleMultiGlobal<Output>>());

  KJ_IF_SOME(slot, slots.find("compositor")) {
    KJ_EXPECT(slot.is<kj::Own<UntypedGlobalHandler>>());
  } else {
    KJ_FAIL_EXPECT("compositor slot missing");
  }
  KJ_IF_SOME(slot, slots.find("output")) {
    KJ_EXPECT(slot.is<kj::Own<UntypedMultiGlobalHandler>>());
  } else {
    KJ_FAIL_EXPECT("output slot missing");
  }
  KJ_EXPECT(slots.find("zxdg_unknown_v1") == kj::none);
}

KJ_TEST("SlotTable typed lookups check the declared kind") {
  SlotTable slots;
  slots.addSingle(Compositor::NAME, kj::heap<SimpleGlobal<Compositor>>());
  slots.addMulti(Output::NAME, kj::heap<SimpleMultiGlobal<Output>>());

  KJ_EXPECT(slots.single<Compositor>().get() == kj::none);
  KJ_EXPECT(slots.multi<Output>().getAll().size() == 0);

  KJ_EXPECT_THROW_MESSAGE("declared as a multi global", slots.single<Output>());
  KJ_EXPECT_THROW_MESSAGE("declared as a single global", slots.multi<Compositor>());
  KJ_EXPECT_THROW_MESSAGE("not declared in this environment", slots.single<Seat>());
  KJ_EXPECT_THROW_MESSAGE("not declared in this environment", slots.multi<Seat>());
}

}  // namespace
}  // namespace globreg
