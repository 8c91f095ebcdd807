// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "global_list.h"
#include "proxy.h"

#include <kj/function.h>

#include <cstdint>
#include <deque>

namespace globreg {

struct GlobalEvent {
  enum class Kind : uint8_t { ADDED, REMOVED };

  Kind kind;
  uint32_t id;
  // Only valid for the duration of the listener call.
  kj::StringPtr interface;
  // Zero for REMOVED.
  uint32_t version;
};

// The client end of a registry connection.
//
// Notifications are queued by the transport and handed to the listener only from
// inside synchronize() or dispatchPending(), on the calling thread, in the order the
// server sent them. Every ADDED and REMOVED event that reaches the listener carries
// the interface name, including removals whose wire form carries only an id.
//
// A listener installed after globals were already dispatched first receives each of
// them as ADDED, ahead of any queued notification. A notification whose listener call
// throws is left unapplied and stays queued for the next round.
class Registry {
 public:
  using Listener = kj::Function<void(const GlobalEvent&)>;

  Registry() = default;
  virtual ~Registry() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(Registry);

  // One listener per registry; installing a second one is an error. The globals known
  // so far are replayed to it by the next round.
  void setListener(Listener listener);
  void clearListener();

  // Every global the server has advertised and not yet retracted, as far as the
  // notifications dispatched so far tell.
  const GlobalList& globals() const { return globals_; }

  // Binds global `id` at `version`. Throws if `id` is not a live global of
  // `interface`, or if `version` exceeds what the server advertised.
  virtual ProxyHandle bind(kj::StringPtr interface, uint32_t id, uint32_t version) = 0;

  // Blocks until the server has answered every request issued so far, then
  // dispatches the notifications it sent in the meantime. Throws on transport failure.
  virtual void synchronize() = 0;

  // Dispatches notifications that have already arrived, without blocking.
  virtual void dispatchPending() = 0;

  // Asks the server to call `done` once it has processed every request issued before
  // this one. `done` runs from a later synchronize() or dispatchPending().
  virtual void callback(kj::Function<void()> done) = 0;

 protected:
  // Called by implementations while dispatching.
  void deliverAdded(uint32_t id, kj::StringPtr interface, uint32_t version);
  void deliverRemoved(uint32_t id);
  // Replays the known globals to a newly installed listener. Called at the start of
  // every round, before queued notifications.
  void replayGlobals();

  // Client-side validation shared by every bind().
  void checkBind(kj::StringPtr interface, uint32_t id, uint32_t version) const;

 private:
  void undoAdd(uint32_t id, kj::Maybe<GlobalInfo>& previous);

  GlobalList globals_;
  kj::Maybe<Listener> listener_;
  std::deque<uint32_t> replay_;
};

}  // namespace globreg
