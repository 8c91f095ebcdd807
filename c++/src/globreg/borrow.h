// Copyright (c) 2026, The globreg Authors.
// Licensed under the MIT License:
// https://opensource.org/licenses/MIT

#pragma once

#include <kj/common.h>

namespace globreg {

// Runtime-checked access discipline for state shared between Environment handles and
// the dispatcher: any number of shared borrows, or exactly one exclusive borrow.
// A conflicting borrow throws instead of blocking, since everything runs on one thread
// and waiting could never succeed.
class BorrowFlag {
 public:
  BorrowFlag() = default;
  KJ_DISALLOW_COPY_AND_MOVE(BorrowFlag);

  class Shared {
   public:
    explicit Shared(BorrowFlag& flag);
    ~Shared() noexcept;
    KJ_DISALLOW_COPY_AND_MOVE(Shared);

   private:
    BorrowFlag& flag_;
  };

  class Exclusive {
   public:
    explicit Exclusive(BorrowFlag& flag);
    ~Exclusive() noexcept;
    KJ_DISALLOW_COPY_AND_MOVE(Exclusive);

   private:
    BorrowFlag& flag_;
  };

  bool isBorrowed() const { return readers_ > 0 || writing_; }
  bool isExclusive() const { return writing_; }

 private:
  unsigned readers_ = 0;
  bool writing_ = false;
};

}  // namespace globreg
