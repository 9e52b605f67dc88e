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
/*
 * TransferThread runs one TransferCoordinator::Transfer() on a POSIX thread
 * of its own so that the transfer can be stopped from outside.
 *
 * Usage
 * - Start() launches the transfer.
 * - CancelCooperatively() raises the CancellationFlag handed to Transfer().
 *   Transfer() only looks at it before touching the pair, so a transfer that
 *   has already debited its source runs to completion.
 * - CancelForcefully() calls pthread_cancel().  The thread runs with deferred
 *   cancellation, so it is stopped at its next cancellation point; for a
 *   transfer parked in its delay that is the sleep itself.  The thread is
 *   unwound: scoped guards still release the pair's mutex, but the credit
 *   never happens and the pair stays torn.
 * - Join() waits for the thread and tells whether it was cancelled.
 */

#pragma once

#include <pthread.h>
#include <stdint.h>

#include <boost/noncopyable.hpp>

#include "account/AccountPair.h"
#include "account/TransferCoordinator.h"
#include "util/cancellation.h"

namespace twinacct {
namespace harness {

class TransferThread : private boost::noncopyable {
 public:
  TransferThread(account::TransferCoordinator* coordinator,
                 int from_account_id, int64_t amount, int64_t delay_ms);

  // Joins the thread if it was started but not joined yet.
  ~TransferThread();

  // @return 0 on success, or a negative error code of pthread_create().
  int Start();

  void CancelCooperatively() { cancel_.Cancel(); }

  // @return 0 on success, or a negative error code of pthread_cancel().
  int CancelForcefully();

  /**
   * Wait for the thread to exit.
   *
   * @param cancelled [out] Whether the thread was stopped by
   *       CancelForcefully() before Transfer() returned; may be null.
   * @return 0 on success, or a negative error code of pthread_join().
   */
  int Join(bool* cancelled);

  // Valid only after Join() when the thread was not cancelled forcefully.
  int result() const { return result_; }
  const account::Balances& balances() const { return balances_; }
  const account::InvariantViolation& violation() const { return violation_; }

 private:
  static void* Run(void* arg);

  account::TransferCoordinator* const coordinator_;
  const int from_account_id_;
  const int64_t amount_;
  const int64_t delay_ms_;

  util::CancellationFlag cancel_;
  pthread_t thread_;
  bool started_ = false;
  bool joined_ = false;

  // Written by the transfer thread; read after Join().
  int result_ = 0;
  account::Balances balances_;
  account::InvariantViolation violation_;
};

}  // namespace harness
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
