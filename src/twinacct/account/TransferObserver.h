// Copyright (c) 2013-2018 Ming Chen
// Copyright (c) 2016-2016 Praveen Kumar Morampudi
// Copyright (c) 2016-2016 Harshkumar Patel
// Copyright (c) 2017-2017 Rushabh Shah
// Copyright (c) 2013-2014 Arun Olappamanna Vasudevan
// Copyright (c) 2013-2014 Kelong Wang
// Copyright (c) 2013-2018 Erez Zadok
// Copyright (c) 2013-2018 Stony Brook University
// Copyright (c) 2013-2018 The Research Foundation for SUNY
// This file is released under the GPL.
// Hooks into the critical section of a transfer.  All methods are called with
// the pair's mutex held, by the thread doing the transfer, so an observer must
// not call back into the TransferCoordinator.

#pragma once

#include <stdint.h>

namespace twinacct {
namespace account {

struct Balances {
  int64_t balance_a = 0;
  int64_t balance_b = 0;
};

class TransferObserver {
 public:
  virtual ~TransferObserver() {}

  // Called right after the pair's mutex is acquired by a transfer.
  virtual void OnAcquired(int from_account_id, int64_t amount) {}

  // Called after the source account has been debited and before the delay.
  // "balances" is the torn intermediate state.
  virtual void OnDebited(int from_account_id, int64_t amount,
                         const Balances& balances) {}

  // Called right before the pair's mutex is released by a transfer that was
  // not cancelled forcefully.
  virtual void OnReleasing(int from_account_id, int64_t amount) {}
};

}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
