// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "registry.h"

#include <globreg/registry.capnp.h>
#include <kj/async.h>
#include <kj/function.h>
#include <kj/one-of.h>
#include <kj/refcount.h>

#include <cstdint>
#include <deque>
#include <string>

namespace globreg {

// Client end of a registry served over Cap'n Proto RPC.
//
// The listener this registry subscribes only queues what the server sends; queued
// notifications are dispatched by synchronize() and dispatchPending(), never from
// inside the event loop. bind() is pipelined: it returns at once and the bound
// capability becomes usable when the server has answered.
class CapnpRegistry final : public Registry, private kj::TaskSet::ErrorHandler {
 public:
  // `waitScope` belongs to the event loop `registry` was obtained on.
  CapnpRegistry(rpc::Registry::Client registry, kj::WaitScope& waitScope);
  ~CapnpRegistry() noexcept(false);

  // Registry
  ProxyHandle bind(kj::StringPtr interface, uint32_t id, uint32_t version) override;
  void synchronize() override;
  void dispatchPending() override;
  void callback(kj::Function<void()> done) override;

 private:
  class ListenerImpl;

  // Shared with the listener capability, which may outlive this object.
  struct Inbox : public kj::Refcounted {
    struct Added {
      uint32_t id;
      std::string interface;
      uint32_t version;
    };
    struct Removed {
      uint32_t id;
    };

    std::deque<kj::OneOf<Added, Removed, kj::Function<void()>>> events;
    kj::Maybe<kj::Exception> failure;
  };

  void drain();
  void taskFailed(kj::Exception&& exception) override;

  rpc::Registry::Client registry_;
  kj::WaitScope& waitScope_;
  kj::Own<Inbox> inbox_;
  kj::TaskSet tasks_;
};

}  // namespace globreg
