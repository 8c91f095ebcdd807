// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include "proxy.h"

#include <kj/array.h>
#include <kj/common.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace globreg {

// The globals the client currently knows to be alive, in advertisement order.
//
// Removal notices on the wire carry only the id, so this list doubles as the
// id -> interface map used to resolve them.
class GlobalList {
 public:
  GlobalList() = default;

  // Records an advertisement. Re-advertising a live id replaces its entry in place.
  void add(uint32_t id, kj::StringPtr interface, uint32_t version);

  // Forgets `id` and returns what it was, or none if the id is not live.
  kj::Maybe<GlobalInfo> remove(uint32_t id);

  kj::Maybe<const GlobalInfo&> find(uint32_t id) const;
  kj::Array<GlobalInfo> list() const;
  size_t size() const { return globals_.size(); }

 private:
  std::vector<GlobalInfo> globals_;
};

}  // namespace globreg
