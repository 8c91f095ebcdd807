// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "proxy.h"

#include <globreg/registry.capnp.h>
#include <kj/array.h>
#include <kj/async.h>
#include <kj/exception.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace globreg {

// Server side of the RPC registry: the authority on which globals exist.
//
// Hand it to a capnp::TwoPartyServer as the bootstrap capability, keeping a
// reference to advertise and retract globals while it runs.
class RegistryServer final : public rpc::Registry::Server,
                             private kj::TaskSet::ErrorHandler {
 public:
  RegistryServer();
  ~RegistryServer() noexcept(false);

  // Ids are the smallest not currently live, starting at 1.
  uint32_t advertise(kj::StringPtr interface, uint32_t version);
  void retract(uint32_t id);

  // The next sync call fails with `exception`.
  void failNextSync(kj::Exception&& exception);

  kj::Array<GlobalInfo> globals() const;
  size_t subscriberCount() const { return listeners_.size(); }

 protected:
  kj::Promise<void> subscribe(SubscribeContext context) override;
  kj::Promise<void> bind(BindContext context) override;
  kj::Promise<void> sync(SyncContext context) override;

 private:
  class GlobalImpl;

  void sendAdded(rpc::RegistryListener::Client& listener, const GlobalInfo& info);
  void taskFailed(kj::Exception&& exception) override;

  std::map<uint32_t, GlobalInfo> globals_;
  std::vector<rpc::RegistryListener::Client> listeners_;
  kj::Maybe<kj::Exception> syncFailure_;
  kj::TaskSet tasks_;
};

}  // namespace globreg
