// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/exception.h>
#include <kj/string.h>

namespace globreg {

// Tracing is off unless GLOBREG_DEBUG is set to a non-empty value.
bool debugEnabled();
void debugLog(const char* label, kj::StringPtr message);

// "<description> (<type>)", followed by the remote trace when there is one.
kj::String describeException(const kj::Exception& e);

}  // namespace globreg
