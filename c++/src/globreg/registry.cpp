// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "registry.h"

#include "debug.h"

#include <kj/debug.h>
#include <kj/exception.h>

namespace globreg {

Registry::~Registry() noexcept(false) {}

void Registry::setListener(Listener listener) {
  bool installed = listener_ != kj::none;
  KJ_REQUIRE(!installed, "registry already has a listener");
  listener_ = kj::mv(listener);
  for (auto& info : globals_.list()) {
    replay_.push_back(info.id);
  }
}

void Registry::clearListener() {
  listener_ = kj::none;
  replay_.clear();
}

void Registry::deliverAdded(uint32_t id, kj::StringPtr interface, uint32_t version) {
  kj::Maybe<GlobalInfo> previous;
  auto known = globals_.find(id);
  KJ_IF_SOME(info, known) {
    previous = info;
  }
  globals_.add(id, interface, version);
  KJ_ON_SCOPE_FAILURE(undoAdd(id, previous));

  debugLog("global", kj::str(id, " ", interface, " v", version));
  KJ_IF_SOME(listener, listener_) {
    listener(GlobalEvent{GlobalEvent::Kind::ADDED, id, interface, version});
  }
}

void Registry::undoAdd(uint32_t id, kj::Maybe<GlobalInfo>& previous) {
  KJ_IF_SOME(info, previous) {
    globals_.add(id, info.interface.c_str(), info.version);
  } else {
    globals_.remove(id);
  }
}

void Registry::deliverRemoved(uint32_t id) {
  auto known = globals_.find(id);
  KJ_IF_SOME(entry, known) {
    GlobalInfo info = entry;
    debugLog("global_remove", kj::str(id, " ", info.interface.c_str()));
    KJ_IF_SOME(listener, listener_) {
      listener(GlobalEvent{GlobalEvent::Kind::REMOVED, id, info.interface.c_str(), 0});
    }
    // Pruned only once the listener has seen it, so a failed call can be retried.
    globals_.remove(id);
  } else {
    debugLog("global_remove", kj::str("ignoring removal of unknown global ", id));
  }
}

void Registry::replayGlobals() {
  while (!replay_.empty()) {
    uint32_t id = replay_.front();
    replay_.pop_front();
    auto known = globals_.find(id);
    KJ_IF_SOME(entry, known) {
      GlobalInfo info = entry;
      KJ_IF_SOME(listener, listener_) {
        KJ_ON_SCOPE_FAILURE(replay_.push_front(id));
        debugLog("global_replay", kj::str(id, " ", info.interface.c_str()));
        listener(GlobalEvent{GlobalEvent::Kind::ADDED, id, info.interface.c_str(),
                             info.version});
      }
    }
  }
}

void Registry::checkBind(kj::StringPtr interface, uint32_t id, uint32_t version) const {
  KJ_IF_SOME(info, globals_.find(id)) {
    KJ_REQUIRE(interface == kj::StringPtr(info.interface.c_str()),
               "bound interface does not match the advertised global", id, interface,
               info.interface.c_str());
    KJ_REQUIRE(version <= info.version, "bind version exceeds the advertised version",
               interface, version, info.version);
  } else {
    KJ_FAIL_REQUIRE("bind of a global that is not advertised", interface, id);
  }
}

}  // namespace globreg
