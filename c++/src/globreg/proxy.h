// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <capnp/capability.h>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/string.h>

#include <cstdint>
#include <memory>
#include <string>

namespace globreg {

// A global as the registry advertised it.
struct GlobalInfo {
  uint32_t id = 0;
  std::string interface;
  uint32_t version = 0;
};

// A global bound at a chosen version. Copies refer to the same bound object; the
// object is released when the last copy goes away.
class ProxyHandle {
 public:
  ProxyHandle(kj::StringPtr interface, uint32_t id, uint32_t version);
  ProxyHandle(kj::StringPtr interface, uint32_t id, uint32_t version,
              capnp::Capability::Client client);

  kj::StringPtr interface() const { return data_->interface.c_str(); }
  uint32_t id() const { return data_->id; }
  uint32_t version() const { return data_->version; }

  // The transport's capability for the bound object, if the transport has one.
  kj::Maybe<capnp::Capability::Client> client() const;

  // True when both handles came from the same bind.
  bool sameObject(const ProxyHandle& other) const { return data_ == other.data_; }

 private:
  struct Data {
    std::string interface;
    uint32_t id;
    uint32_t version;
    kj::Maybe<capnp::Capability::Client> client;
  };

  std::shared_ptr<Data> data_;
};

// A ProxyHandle tagged with the interface marker it was bound as. A marker is any
// type with `static constexpr char NAME[]` and `static constexpr uint32_t VERSION`.
template <typename I>
class Proxy {
 public:
  explicit Proxy(ProxyHandle handle) : handle_(kj::mv(handle)) {}

  static kj::StringPtr interface() { return I::NAME; }
  uint32_t id() const { return handle_.id(); }
  uint32_t version() const { return handle_.version(); }
  const ProxyHandle& handle() const { return handle_; }

  template <typename T>
  typename T::Client castAs() const {
    auto maybeClient = handle_.client();
    KJ_IF_SOME(client, maybeClient) {
      return client.template castAs<T>();
    }
    KJ_FAIL_REQUIRE("bound global has no remote capability", interface(), id());
  }

 private:
  ProxyHandle handle_;
};

}  // namespace globreg
