// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "debug.h"

#include <cstdio>
#include <cstdlib>

namespace globreg {

bool debugEnabled() {
  static bool enabled = []() {
    const char* flag = std::getenv("GLOBREG_DEBUG");
    return flag != nullptr && flag[0] != '\0';
  }();
  return enabled;
}

void debugLog(const char* label, kj::StringPtr message) {
  if (!debugEnabled()) return;
  std::fprintf(stderr, "[globreg] %s: %s\n", label, message.cStr());
  std::fflush(stderr);
}

kj::String describeException(const kj::Exception& e) {
  kj::StringPtr remoteTrace = e.getRemoteTrace();
  if (remoteTrace.size() > 0) {
    return kj::str(e.getDescription(), " (", e.getType(), ")\nremote trace: ", remoteTrace);
  }
  return kj::str(e.getDescription(), " (", e.getType(), ")");
}

}  // namespace globreg
