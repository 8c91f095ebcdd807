// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "proxy.h"

namespace globreg {

ProxyHandle::ProxyHandle(kj::StringPtr interface, uint32_t id, uint32_t version)
    : data_(std::make_shared<Data>(Data{std::string(interface.cStr()), id, version, kj::none})) {}

ProxyHandle::ProxyHandle(kj::StringPtr interface, uint32_t id, uint32_t version,
                         capnp::Capability::Client client)
    : data_(std::make_shared<Data>(
          Data{std::string(interface.cStr()), id, version, kj::mv(client)})) {}

kj::Maybe<capnp::Capability::Client> ProxyHandle::client() const {
  KJ_IF_SOME(client, data_->client) {
    capnp::Capability::Client copy = client;
    return kj::mv(copy);
  }
  return kj::none;
}

}  // namespace globreg
