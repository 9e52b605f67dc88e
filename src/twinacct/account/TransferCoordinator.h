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
 * TransferCoordinator owns an AccountPair and the mutex that guards it.
 *
 * Design
 * - Every operation, reads included, runs with the mutex held, so no caller
 *   ever sees the pair between a debit and its credit.
 * - Transfer() writes three lines to the transfer log: "called" before taking
 *   the mutex, "acquired" once it holds it, and "released" after letting it
 *   go.  A transfer whose thread is cancelled in the middle never writes the
 *   "released" line.
 * - The mutex is held through a util::LockGuard, so it is released even when
 *   the thread is unwound by pthread_cancel().  The pair is not rolled back.
 * - An optional util::CancellationFlag is checked before the mutex is taken
 *   and again before the pair is touched.  A cancelled transfer returns
 *   kCancelled with the pair unchanged.
 */

#pragma once

#include <stdint.h>

#include <boost/noncopyable.hpp>

#include "account/AccountPair.h"
#include "account/TransferObserver.h"
#include "port/thread_annotations.h"
#include "util/cancellation.h"
#include "util/line_logger.h"
#include "util/mutex.h"

namespace twinacct {
namespace account {

// TransferCoordinator is thread-safe.
class TransferCoordinator : private boost::noncopyable {
 public:
  // "logger" and "observer" are not owned; "observer" may be null.
  TransferCoordinator(int64_t invariant_total, int64_t balance_a,
                      int64_t balance_b, util::LineLogger* logger,
                      TransferObserver* observer = nullptr);

  /**
   * @return 0 on success, or kInvalidAccountId.
   */
  int GetBalance(int account_id, int64_t* balance) EXCLUDES(mu_);

  int64_t TotalBalance() EXCLUDES(mu_);

  /**
   * Move "amount" from account "from_account_id" to the other account while
   * holding the pair's mutex.  See AccountPair::Transfer().
   *
   * @param[in] cancel Cooperative cancellation request; may be null.
   * @return 0 on success, kInvalidAccountId, kInvariantViolation, or
   *       kCancelled.
   */
  int Transfer(int from_account_id, int64_t amount, int64_t delay_ms,
               Balances* balances, InvariantViolation* violation,
               const util::CancellationFlag* cancel = nullptr) EXCLUDES(mu_);

 private:
  void Log(const char* event, int from_account_id, int64_t amount);

  util::Mutex mu_;
  AccountPair pair_ GUARDED_BY(mu_);
  util::LineLogger* const logger_;
  TransferObserver* const observer_;
};

}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
