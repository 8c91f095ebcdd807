// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include <globreg/debug.h>

#include <kj/test.h>

#include <cstring>

namespace globreg {
namespace {

KJ_TEST("describeException names the exception type") {
  auto exception = KJ_EXCEPTION(DISCONNECTED, "peer went away");
  auto text = describeException(exception);

  KJ_EXPECT(text.startsWith("peer went away ("));
  auto type = kj::str(exception.getType());
  KJ_EXPECT(std::strstr(text.cStr(), type.cStr()) != nullptr, text, type);
  KJ_EXPECT(std::strstr(text.cStr(), "remote trace") == nullptr, text);
}

KJ_TEST("describeException appends the remote trace") {
  auto exception = KJ_EXCEPTION(FAILED, "bind refused");
  exception.setRemoteTrace(kj::str("registry_server.cpp:42"));
  auto text = describeException(exception);

  KJ_EXPECT(text.endsWith("\nremote trace: registry_server.cpp:42"), text);
}

}  // namespace
}  // namespace globreg
