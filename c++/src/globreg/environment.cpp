// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "environment.h"

#include "debug.h"

namespace globreg {

void runInitialRoundtrip(Registry& registry, uint32_t round) {
  debugLog("init", kj::str("roundtrip ", round));
  auto failure = kj::runCatchingExceptions([&]() { registry.synchronize(); });
  KJ_IF_SOME(exception, failure) {
    debugLog("init", kj::str("roundtrip ", round, " failed: ", describeException(exception)));
    kj::throwFatalException(kj::Exception(
        exception.getType(), __FILE__, __LINE__,
        kj::str("initial roundtrip failed (round ", round, "): ", exception.getDescription())));
  }
}

}  // namespace globreg
