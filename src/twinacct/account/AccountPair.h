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
// An AccountPair is two balances whose sum must stay equal to the total
// recorded when the pair was created.
//
// Transfer() moves money in two steps, debit then credit, with an optional
// sleep in between.  A thread stopped during that sleep leaves the pair with
// the debit applied and the credit missing.  Nothing repairs such a torn pair;
// the next Transfer() finds the mismatch and refuses to run.
//
// AccountPair is NOT thread-safe.  Shared pairs live inside a
// TransferCoordinator, which serializes every access.

#pragma once

#include <errno.h>
#include <stdint.h>

#include "account/TransferObserver.h"

namespace twinacct {
namespace account {

// Error codes returned by the account operations, as negated errno values.
const int kInvalidAccountId = -EINVAL;
const int kInvariantViolation = -ENOTRECOVERABLE;
const int kCancelled = -ECANCELED;
const int kOverflow = -EOVERFLOW;

// Returns a short name of the error codes above, or "OK" for 0.
const char* ErrorName(int code);

// Diagnostics of kInvariantViolation: the balances found at the start of the
// transfer and the total they should sum to.
struct InvariantViolation {
  int64_t balance_a = 0;
  int64_t balance_b = 0;
  int64_t expected_total = 0;
};

class AccountPair {
 public:
  // "invariant_total" is taken as given and is not checked against the
  // balances.  Dies if "balance_a" + "balance_b" does not fit in int64_t.
  AccountPair(int64_t invariant_total, int64_t balance_a, int64_t balance_b);

  /**
   * Read the balance of account 1 or 2.
   *
   * @return 0 on success, or kInvalidAccountId.
   */
  int GetBalance(int account_id, int64_t* balance) const;

  int64_t TotalBalance() const { return balance_a_ + balance_b_; }

  int64_t invariant_total() const { return invariant_total_; }

  /**
   * Move "amount" out of account "from_account_id" into the other account.
   *
   * @param[in] from_account_id 1 or 2.
   * @param[in] delay_ms Milliseconds to sleep between the debit and the
   *       credit; no sleep if not positive.
   * @param[in] observer Notified after the debit; may be null.
   * @param[out] balances The balances after the transfer; may be null.
   * @param[out] violation Filled on kInvariantViolation; may be null.
   * @return 0 on success, kInvalidAccountId, kInvariantViolation, or
   *       kOverflow if either balance would leave the range of int64_t.
   *       Nothing is changed on failure.
   */
  int Transfer(int from_account_id, int64_t amount, int64_t delay_ms,
               TransferObserver* observer, Balances* balances,
               InvariantViolation* violation);

 private:
  const int64_t invariant_total_;
  int64_t balance_a_;
  int64_t balance_b_;
};

}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
