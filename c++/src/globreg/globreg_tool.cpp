// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "capnp_registry.h"
#include "environment.h"
#include "registry_server.h"

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/string.h>
#include <kj/vector.h>

#include <cstdio>

#ifndef GLOBREG_VERSION
#define GLOBREG_VERSION "(unknown)"
#endif

namespace globreg {
namespace {

class GlobregToolMain {
 public:
  explicit GlobregToolMain(kj::ProcessContext& context) : context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "globreg-tool version " GLOBREG_VERSION,
          "Runs or inspects a registry of globals served over Cap'n Proto RPC.")
        .addSubCommand("serve", KJ_BIND_METHOD(*this, getServeMain),
                       "serve a registry advertising the given globals")
        .addSubCommand("list", KJ_BIND_METHOD(*this, getListMain),
                       "list the globals a registry advertises")
        .build();
  }

  kj::MainFunc getServeMain() {
    return kj::MainBuilder(context, "globreg-tool version " GLOBREG_VERSION,
          "Listens on <address> and advertises one global per <interface>:<version> "
          "argument, e.g.:\n"
          "    globreg-tool serve unix:/tmp/registry compositor:4 output:2 output:2")
        .expectArg("<address>", KJ_BIND_METHOD(*this, setAddress))
        .expectZeroOrMoreArgs("<interface>:<version>", KJ_BIND_METHOD(*this, addGlobal))
        .callAfterParsing(KJ_BIND_METHOD(*this, serve))
        .build();
  }

  kj::MainFunc getListMain() {
    return kj::MainBuilder(context, "globreg-tool version " GLOBREG_VERSION,
          "Connects to the registry at <address> and prints every global it advertises "
          "as `<id> <interface> v<version>`.")
        .expectArg("<address>", KJ_BIND_METHOD(*this, setAddress))
        .callAfterParsing(KJ_BIND_METHOD(*this, list))
        .build();
  }

  kj::MainBuilder::Validity setAddress(kj::StringPtr value) {
    address = kj::str(value);
    return true;
  }

  kj::MainBuilder::Validity addGlobal(kj::StringPtr value) {
    auto maybeColon = value.findFirst(':');
    KJ_IF_SOME(colon, maybeColon) {
      if (colon == 0) {
        return kj::str("missing interface name in: ", value);
      }
      auto maybeVersion = value.slice(colon + 1).tryParseAs<uint32_t>();
      KJ_IF_SOME(version, maybeVersion) {
        if (version == 0) {
          return kj::str("versions start at 1: ", value);
        }
        globals.add(GlobalSpec{kj::heapString(value.slice(0, colon)), version});
        return true;
      }
      return kj::str("invalid version in: ", value);
    }
    return kj::str("expected <interface>:<version>, got: ", value);
  }

  kj::MainBuilder::Validity serve() {
    auto io = kj::setupAsyncIo();
    auto impl = kj::heap<RegistryServer>();
    for (auto& global : globals) {
      impl->advertise(global.interface, global.version);
    }
    capnp::TwoPartyServer server(capnp::Capability::Client(kj::mv(impl)));

    auto addr = io.provider->getNetwork().parseAddress(address).wait(io.waitScope);
    auto listener = addr->listen();
    context.warning(kj::str("serving ", globals.size(), " globals on ", address));
    server.listen(*listener).wait(io.waitScope);
    return true;
  }

  kj::MainBuilder::Validity list() {
    auto io = kj::setupAsyncIo();
    auto addr = io.provider->getNetwork().parseAddress(address).wait(io.waitScope);
    auto stream = addr->connect().wait(io.waitScope);
    capnp::TwoPartyClient client(*stream);

    CapnpRegistry registry(client.bootstrap().castAs<rpc::Registry>(), io.waitScope);
    auto env = initEnvironment(registry, Declaration<>());
    for (auto& global : env.globals()) {
      std::printf("%u %s v%u\n", global.id, global.interface.c_str(), global.version);
    }
    std::fflush(stdout);
    return true;
  }

 private:
  struct GlobalSpec {
    kj::String interface;
    uint32_t version;
  };

  kj::ProcessContext& context;
  kj::String address;
  kj::Vector<GlobalSpec> globals;
};

}  // namespace
}  // namespace globreg

KJ_MAIN(globreg::GlobregToolMain);
