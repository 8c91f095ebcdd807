// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "local_registry.h"

#include "debug.h"

#include <kj/debug.h>
#include <kj/exception.h>

namespace globreg {

LocalRegistry::~LocalRegistry() noexcept(false) {}

uint32_t LocalRegistry::advertise(kj::StringPtr interface, uint32_t version) {
  uint32_t id = 1;
  for (auto& entry : live_) {
    if (entry.first != id) break;
    ++id;
  }
  live_.emplace(id, GlobalInfo{id, std::string(interface.cStr()), version});
  pending_.push_back(Announce{id, std::string(interface.cStr()), version});
  return id;
}

void LocalRegistry::retract(uint32_t id) {
  size_t erased = live_.erase(id);
  KJ_REQUIRE(erased == 1, "no such global", id);
  pending_.push_back(Retract{id});
}

void LocalRegistry::reannounce(uint32_t id) {
  KJ_REQUIRE(live_.count(id) == 1, "no such global", id);
  auto& info = live_.at(id);
  pending_.push_back(Announce{id, info.interface, info.version});
}

void LocalRegistry::failNextSync(kj::Exception&& exception) {
  syncFailure_ = kj::mv(exception);
}

uint32_t LocalRegistry::bindCount(uint32_t id) const {
  auto it = bindCounts_.find(id);
  return it == bindCounts_.end() ? 0 : it->second;
}

ProxyHandle LocalRegistry::bind(kj::StringPtr interface, uint32_t id, uint32_t version) {
  checkBind(interface, id, version);
  ++bindCounts_[id];
  return ProxyHandle(interface, id, version);
}

void LocalRegistry::synchronize() {
  KJ_IF_SOME(exception, syncFailure_) {
    auto failure = kj::mv(exception);
    syncFailure_ = kj::none;
    kj::throwFatalException(kj::mv(failure));
  }
  runRound();
}

void LocalRegistry::dispatchPending() { runRound(); }

void LocalRegistry::callback(kj::Function<void()> done) { pending_.push_back(kj::mv(done)); }

void LocalRegistry::runRound() {
  replayGlobals();

  size_t count = pending_.size();
  debugLog("local", kj::str("dispatching ", count, " pending notifications"));
  for (size_t i = 0; i < count; ++i) {
    Pending next = kj::mv(pending_.front());
    pending_.pop_front();
    KJ_SWITCH_ONEOF(next) {
      KJ_CASE_ONEOF(announce, Announce) {
        KJ_ON_SCOPE_FAILURE(pending_.push_front(kj::mv(announce)));
        deliverAdded(announce.id, announce.interface.c_str(), announce.version);
      }
      KJ_CASE_ONEOF(retract, Retract) {
        KJ_ON_SCOPE_FAILURE(pending_.push_front(retract));
        deliverRemoved(retract.id);
      }
      KJ_CASE_ONEOF(done, kj::Function<void()>) {
        done();
      }
    }
  }
}

}  // namespace globreg
