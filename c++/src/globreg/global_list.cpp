// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "global_list.h"

#include <algorithm>

namespace globreg {

void GlobalList::add(uint32_t id, kj::StringPtr interface, uint32_t version) {
  auto it = std::find_if(globals_.begin(), globals_.end(),
                         [id](const GlobalInfo& info) { return info.id == id; });
  if (it != globals_.end()) {
    it->interface = interface.cStr();
    it->version = version;
    return;
  }
  globals_.push_back(GlobalInfo{id, std::string(interface.cStr()), version});
}

kj::Maybe<GlobalInfo> GlobalList::remove(uint32_t id) {
  auto it = std::find_if(globals_.begin(), globals_.end(),
                         [id](const GlobalInfo& info) { return info.id == id; });
  if (it == globals_.end()) {
    return kj::none;
  }
  GlobalInfo info = std::move(*it);
  globals_.erase(it);
  return kj::mv(info);
}

kj::Maybe<const GlobalInfo&> GlobalList::find(uint32_t id) const {
  for (auto& info : globals_) {
    if (info.id == id) {
      return info;
    }
  }
  return kj::none;
}

kj::Array<GlobalInfo> GlobalList::list() const {
  auto builder = kj::heapArrayBuilder<GlobalInfo>(globals_.size());
  for (auto& info : globals_) {
    builder.add(info);
  }
  return builder.finish();
}

}  // namespace globreg
