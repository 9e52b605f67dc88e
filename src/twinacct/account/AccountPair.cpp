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
#include "account/AccountPair.h"

#include <glog/logging.h>

#include <chrono>
#include <thread>

namespace twinacct {
namespace account {

const char* ErrorName(int code) {
  switch (code) {
    case 0:
      return "OK";
    case kInvalidAccountId:
      return "InvalidAccountId";
    case kInvariantViolation:
      return "InvariantViolation";
    case kCancelled:
      return "Cancelled";
    case kOverflow:
      return "Overflow";
    default:
      return "Unknown";
  }
}

AccountPair::AccountPair(int64_t invariant_total, int64_t balance_a,
                         int64_t balance_b)
    : invariant_total_(invariant_total),
      balance_a_(balance_a),
      balance_b_(balance_b) {
  int64_t total = 0;
  CHECK(!__builtin_add_overflow(balance_a, balance_b, &total))
      << "balances " << balance_a << " and " << balance_b << " overflow";
}

int AccountPair::GetBalance(int account_id, int64_t* balance) const {
  switch (account_id) {
    case 1:
      *balance = balance_a_;
      return 0;
    case 2:
      *balance = balance_b_;
      return 0;
    default:
      return kInvalidAccountId;
  }
}

int AccountPair::Transfer(int from_account_id, int64_t amount,
                          int64_t delay_ms, TransferObserver* observer,
                          Balances* balances, InvariantViolation* violation) {
  int64_t total = TotalBalance();
  if (total != invariant_total_) {
    if (violation != nullptr) {
      violation->balance_a = balance_a_;
      violation->balance_b = balance_b_;
      violation->expected_total = invariant_total_;
    }
    return kInvariantViolation;
  }

  int64_t* source = nullptr;
  int64_t* destination = nullptr;
  if (from_account_id == 1) {
    source = &balance_a_;
    destination = &balance_b_;
  } else if (from_account_id == 2) {
    source = &balance_b_;
    destination = &balance_a_;
  } else {
    return kInvalidAccountId;
  }

  // The torn sum between the debit and the credit must fit as well.
  int64_t debited = 0;
  int64_t credited = 0;
  int64_t torn_total = 0;
  if (__builtin_sub_overflow(*source, amount, &debited) ||
      __builtin_add_overflow(*destination, amount, &credited) ||
      __builtin_add_overflow(debited, *destination, &torn_total)) {
    VLOG(1) << "transfer of " << amount << " from account "
            << from_account_id << " overflows";
    return kOverflow;
  }

  *source = debited;
  if (observer != nullptr) {
    Balances torn;
    torn.balance_a = balance_a_;
    torn.balance_b = balance_b_;
    observer->OnDebited(from_account_id, amount, torn);
  }
  // A thread cancelled here never gets to the credit below.
  if (delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
  }
  *destination = credited;

  if (balances != nullptr) {
    balances->balance_a = balance_a_;
    balances->balance_b = balance_b_;
  }
  return 0;
}

}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
