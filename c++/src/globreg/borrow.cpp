// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#include "borrow.h"

#include <kj/debug.h>

namespace globreg {

BorrowFlag::Shared::Shared(BorrowFlag& flag) : flag_(flag) {
  KJ_REQUIRE(!flag_.writing_,
             "environment state is already borrowed exclusively; "
             "accessors cannot be used from inside withExtras()");
  ++flag_.readers_;
}

BorrowFlag::Shared::~Shared() noexcept { --flag_.readers_; }

BorrowFlag::Exclusive::Exclusive(BorrowFlag& flag) : flag_(flag) {
  KJ_REQUIRE(!flag_.writing_, "environment state is already borrowed exclusively");
  KJ_REQUIRE(flag_.readers_ == 0, "environment state is already borrowed",
             flag_.readers_);
  flag_.writing_ = true;
}

BorrowFlag::Exclusive::~Exclusive() noexcept { flag_.writing_ = false; }

}  // namespace globreg
