// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "capnp_registry.h"

#include "debug.h"

#include <capnp/capability.h>
#include <kj/debug.h>
#include <kj/exception.h>

namespace globreg {

class CapnpRegistry::ListenerImpl final : public rpc::RegistryListener::Server {
 public:
  explicit ListenerImpl(kj::Own<Inbox> inbox) : inbox_(kj::mv(inbox)) {}

 protected:
  kj::Promise<void> added(AddedContext context) override {
    auto params = context.getParams();
    inbox_->events.push_back(Inbox::Added{
        params.getId(), std::string(params.getInterfaceName().cStr()), params.getVersion()});
    return kj::READY_NOW;
  }

  kj::Promise<void> removed(RemovedContext context) override {
    inbox_->events.push_back(Inbox::Removed{context.getParams().getId()});
    return kj::READY_NOW;
  }

 private:
  kj::Own<Inbox> inbox_;
};

CapnpRegistry::CapnpRegistry(rpc::Registry::Client registry, kj::WaitScope& waitScope)
    : registry_(kj::mv(registry)),
      waitScope_(waitScope),
      inbox_(kj::refcounted<Inbox>()),
      tasks_(*static_cast<kj::TaskSet::ErrorHandler*>(this)) {
  auto request = registry_.subscribeRequest();
  request.setListener(kj::heap<ListenerImpl>(kj::addRef(*inbox_)));
  tasks_.add(request.send().ignoreResult().catch_(
      [inbox = kj::addRef(*inbox_)](kj::Exception&& e) mutable {
        inbox->failure = kj::mv(e);
      }));
}

CapnpRegistry::~CapnpRegistry() noexcept(false) {}

ProxyHandle CapnpRegistry::bind(kj::StringPtr interface, uint32_t id, uint32_t version) {
  checkBind(interface, id, version);
  auto request = registry_.bindRequest();
  request.setId(id);
  request.setInterfaceName(interface);
  request.setVersion(version);
  capnp::Capability::Client global = request.send().getGlobal();
  return ProxyHandle(interface, id, version, kj::mv(global));
}

void CapnpRegistry::synchronize() {
  registry_.syncRequest().send().ignoreResult().wait(waitScope_);
  // Listener calls that arrived ahead of the answer may still be queued on the loop.
  waitScope_.poll();
  drain();
}

void CapnpRegistry::dispatchPending() {
  waitScope_.poll();
  drain();
}

void CapnpRegistry::callback(kj::Function<void()> done) {
  tasks_.add(registry_.syncRequest().send().ignoreResult().then(
      [inbox = kj::addRef(*inbox_), done = kj::mv(done)]() mutable {
        inbox->events.push_back(kj::mv(done));
      }));
}

void CapnpRegistry::drain() {
  KJ_IF_SOME(exception, inbox_->failure) {
    kj::throwFatalException(kj::cp(exception));
  }
  replayGlobals();
  while (!inbox_->events.empty()) {
    auto next = kj::mv(inbox_->events.front());
    inbox_->events.pop_front();
    KJ_SWITCH_ONEOF(next) {
      KJ_CASE_ONEOF(added, Inbox::Added) {
        KJ_ON_SCOPE_FAILURE(inbox_->events.push_front(kj::mv(added)));
        deliverAdded(added.id, added.interface.c_str(), added.version);
      }
      KJ_CASE_ONEOF(removed, Inbox::Removed) {
        KJ_ON_SCOPE_FAILURE(inbox_->events.push_front(removed));
        deliverRemoved(removed.id);
      }
      KJ_CASE_ONEOF(done, kj::Function<void()>) {
        done();
      }
    }
  }
}

void CapnpRegistry::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "registry request failed", describeException(exception));
}

}  // namespace globreg
