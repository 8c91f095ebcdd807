// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "registry.h"

#include <kj/exception.h>
#include <kj/function.h>
#include <kj/one-of.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <unordered_map>

namespace globreg {

// A registry whose server lives in the same process.
//
// The server side (advertise, retract, reannounce) queues notifications. A round,
// synchronize() or dispatchPending(), dispatches exactly the notifications that were
// queued when it started; anything queued while it runs, such as the answer to a
// callback() a handler issued, waits for the next round. That is the behaviour of a
// real server answering a sync request: requests sent after it are answered after it.
class LocalRegistry final : public Registry {
 public:
  LocalRegistry() = default;
  ~LocalRegistry() noexcept(false);

  // Server side.

  // Advertises a new global and returns its id: the smallest id not currently live,
  // starting at 1.
  uint32_t advertise(kj::StringPtr interface, uint32_t version);
  // Retracts a live global.
  void retract(uint32_t id);
  // Sends the advertisement of a live global again, as a misbehaving server might.
  void reannounce(uint32_t id);
  // Makes the next synchronize() throw `exception` before dispatching anything.
  void failNextSync(kj::Exception&& exception);

  size_t pendingCount() const { return pending_.size(); }
  uint32_t bindCount(uint32_t id) const;

  // Registry
  ProxyHandle bind(kj::StringPtr interface, uint32_t id, uint32_t version) override;
  void synchronize() override;
  void dispatchPending() override;
  void callback(kj::Function<void()> done) override;

 private:
  struct Announce {
    uint32_t id;
    std::string interface;
    uint32_t version;
  };
  struct Retract {
    uint32_t id;
  };
  using Pending = kj::OneOf<Announce, Retract, kj::Function<void()>>;

  void runRound();

  std::map<uint32_t, GlobalInfo> live_;
  std::deque<Pending> pending_;
  kj::Maybe<kj::Exception> syncFailure_;
  std::unordered_map<uint32_t, uint32_t> bindCounts_;
};

}  // namespace globreg
