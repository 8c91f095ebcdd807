// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <globreg/local_registry.h>

#include <kj/test.h>
#include <kj/vector.h>

namespace globreg {
namespace {

struct Recorded {
  GlobalEvent::Kind kind;
  uint32_t id;
  std::string interface;
};

void record(LocalRegistry& registry, kj::Vector<Recorded>& events) {
  registry.setListener([&events](const GlobalEvent& event) {
    events.add(Recorded{event.kind, event.id, std::string(event.interface.cStr())});
  });
}

KJ_TEST("LocalRegistry hands out the smallest free id") {
  LocalRegistry registry;
  KJ_EXPECT(registry.advertise("compositor", 4) == 1);
  KJ_EXPECT(registry.advertise("output", 2) == 2);
  KJ_EXPECT(registry.advertise("output", 2) == 3);

  registry.retract(2);
  KJ_EXPECT(registry.advertise("seat", 7) == 2);
  KJ_EXPECT(registry.advertise("seat", 7) == 4);
}

KJ_TEST("LocalRegistry delivers notifications only when synchronized") {
  LocalRegistry registry;
  kj::Vector<Recorded> events;
  record(registry, events);

  registry.advertise("compositor", 4);
  registry.advertise("output", 2);
  KJ_EXPECT(events.size() == 0);
  KJ_EXPECT(registry.pendingCount() == 2);

  registry.synchronize();
  KJ_ASSERT(events.size() == 2);
  KJ_EXPECT(events[0].kind == GlobalEvent::Kind::ADDED);
  KJ_EXPECT(events[0].interface == "compositor");
  KJ_EXPECT(events[1].interface == "output");
  KJ_EXPECT(registry.globals().size() == 2);
}

KJ_TEST("LocalRegistry resolves the interface of a removal") {
  LocalRegistry registry;
  kj::Vector<Recorded> events;
  record(registry, events);

  uint32_t id = registry.advertise("output", 2);
  registry.synchronize();
  registry.retract(id);
  registry.dispatchPending();

  KJ_ASSERT(events.size() == 2);
  KJ_EXPECT(events[1].kind == GlobalEvent::Kind::REMOVED);
  KJ_EXPECT(events[1].id == id);
  KJ_EXPECT(events[1].interface == "output");
  KJ_EXPECT(registry.globals().size() == 0);
}

KJ_TEST("LocalRegistry answers callbacks in the following round") {
  LocalRegistry registry;
  bool answered = false;
  registry.setListener([&](const GlobalEvent&) {
    registry.callback([&answered]() { answered = true; });
  });

  registry.advertise("compositor", 4);
  registry.synchronize();
  KJ_EXPECT(!answered);
  KJ_EXPECT(registry.pendingCount() == 1);

  registry.synchronize();
  KJ_EXPECT(answered);
}

KJ_TEST("LocalRegistry checks binds against the advertisement") {
  LocalRegistry registry;
  uint32_t id = registry.advertise("compositor", 4);

  KJ_EXPECT_THROW_MESSAGE("not advertised", registry.bind("compositor", id, 4));

  registry.synchronize();
  auto proxy = registry.bind("compositor", id, 3);
  KJ_EXPECT(proxy.id() == id);
  KJ_EXPECT(proxy.version() == 3);
  KJ_EXPECT(proxy.interface() == "compositor");
  KJ_EXPECT(proxy.client() == kj::none);
  KJ_EXPECT(registry.bindCount(id) == 1);

  KJ_EXPECT_THROW_MESSAGE("exceeds the advertised version", registry.bind("compositor", id, 5));
  KJ_EXPECT_THROW_MESSAGE("does not match", registry.bind("output", id, 1));
  KJ_EXPECT(registry.bindCount(id) == 1);
}

KJ_TEST("LocalRegistry injects synchronization failures once") {
  LocalRegistry registry;
  registry.advertise("compositor", 4);
  registry.failNextSync(KJ_EXCEPTION(DISCONNECTED, "connection lost"));

  KJ_EXPECT_THROW(DISCONNECTED, registry.synchronize());
  KJ_EXPECT(registry.pendingCount() == 1);

  registry.synchronize();
  KJ_EXPECT(registry.pendingCount() == 0);
  KJ_EXPECT(registry.globals().size() == 1);
}

KJ_TEST("LocalRegistry refuses a second listener") {
  LocalRegistry registry;
  registry.setListener([](const GlobalEvent&) {});
  KJ_EXPECT_THROW_MESSAGE("already has a listener",
                          registry.setListener([](const GlobalEvent&) {}));
  registry.clearListener();
  registry.setListener([](const GlobalEvent&) {});
}

KJ_TEST("LocalRegistry refuses to retract what it never advertised") {
  LocalRegistry registry;
  KJ_EXPECT_THROW_MESSAGE("no such global", registry.retract(9));
}

}  // namespace
}  // namespace globreg
