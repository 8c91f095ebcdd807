// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "registry_server.h"

#include "debug.h"

#include <kj/debug.h>

#include <string>

namespace globreg {

class RegistryServer::GlobalImpl final : public rpc::Global::Server {
 public:
  GlobalImpl(uint32_t id, std::string interface, uint32_t version)
      : id_(id), interface_(std::move(interface)), version_(version) {}

 protected:
  kj::Promise<void> info(InfoContext context) override {
    auto results = context.getResults();
    results.setId(id_);
    results.setInterfaceName(interface_.c_str());
    results.setVersion(version_);
    return kj::READY_NOW;
  }

 private:
  uint32_t id_;
  std::string interface_;
  uint32_t version_;
};

RegistryServer::RegistryServer() : tasks_(*static_cast<kj::TaskSet::ErrorHandler*>(this)) {}

RegistryServer::~RegistryServer() noexcept(false) {}

uint32_t RegistryServer::advertise(kj::StringPtr interface, uint32_t version) {
  uint32_t id = 1;
  for (auto& entry : globals_) {
    if (entry.first != id) break;
    ++id;
  }
  auto& info = globals_[id];
  info = GlobalInfo{id, std::string(interface.cStr()), version};
  for (auto& listener : listeners_) {
    sendAdded(listener, info);
  }
  return id;
}

void RegistryServer::retract(uint32_t id) {
  size_t erased = globals_.erase(id);
  KJ_REQUIRE(erased == 1, "no such global", id);
  for (auto& listener : listeners_) {
    auto request = listener.removedRequest();
    request.setId(id);
    tasks_.add(request.send().ignoreResult());
  }
}

void RegistryServer::failNextSync(kj::Exception&& exception) {
  syncFailure_ = kj::mv(exception);
}

kj::Array<GlobalInfo> RegistryServer::globals() const {
  auto builder = kj::heapArrayBuilder<GlobalInfo>(globals_.size());
  for (auto& entry : globals_) {
    builder.add(entry.second);
  }
  return builder.finish();
}

kj::Promise<void> RegistryServer::subscribe(SubscribeContext context) {
  auto listener = context.getParams().getListener();
  for (auto& entry : globals_) {
    sendAdded(listener, entry.second);
  }
  listeners_.push_back(kj::mv(listener));
  debugLog("server", kj::str("subscriber ", listeners_.size(), " added"));
  return kj::READY_NOW;
}

kj::Promise<void> RegistryServer::bind(BindContext context) {
  auto params = context.getParams();
  uint32_t id = params.getId();
  auto interface = params.getInterfaceName();
  KJ_REQUIRE(globals_.count(id) == 1, "no such global", id, interface);
  auto& info = globals_.at(id);
  KJ_REQUIRE(interface == kj::StringPtr(info.interface.c_str()),
             "bound interface does not match the advertised global", id, interface);
  KJ_REQUIRE(params.getVersion() <= info.version,
             "bind version exceeds the advertised version", interface, params.getVersion(),
             info.version);
  context.getResults().setGlobal(kj::heap<GlobalImpl>(id, info.interface, params.getVersion()));
  return kj::READY_NOW;
}

kj::Promise<void> RegistryServer::sync(SyncContext) {
  KJ_IF_SOME(exception, syncFailure_) {
    auto failure = kj::mv(exception);
    syncFailure_ = kj::none;
    return kj::mv(failure);
  }
  return kj::READY_NOW;
}

void RegistryServer::sendAdded(rpc::RegistryListener::Client& listener, const GlobalInfo& info) {
  auto request = listener.addedRequest();
  request.setId(info.id);
  request.setInterfaceName(info.interface.c_str());
  request.setVersion(info.version);
  tasks_.add(request.send().ignoreResult());
}

void RegistryServer::taskFailed(kj::Exception&& exception) {
  KJ_LOG(WARNING, "registry listener call failed", describeException(exception));
}

}  // namespace globreg
