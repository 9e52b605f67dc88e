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
#include "account/TransferCoordinator.h"

#include <glog/logging.h>

#include <sstream>

#include "util/common.h"

namespace twinacct {
namespace account {

TransferCoordinator::TransferCoordinator(int64_t invariant_total,
                                         int64_t balance_a, int64_t balance_b,
                                         util::LineLogger* logger,
                                         TransferObserver* observer)
    : pair_(invariant_total, balance_a, balance_b),
      logger_(CHECK_NOTNULL(logger)),
      observer_(observer) {}

int TransferCoordinator::GetBalance(int account_id, int64_t* balance) {
  util::LockGuard lock(&mu_);
  return pair_.GetBalance(account_id, balance);
}

int64_t TransferCoordinator::TotalBalance() {
  util::LockGuard lock(&mu_);
  return pair_.TotalBalance();
}

int TransferCoordinator::Transfer(int from_account_id, int64_t amount,
                                  int64_t delay_ms, Balances* balances,
                                  InvariantViolation* violation,
                                  const util::CancellationFlag* cancel) {
  Log("called transfer", from_account_id, amount);
  if (cancel != nullptr && cancel->IsCancelled()) {
    VLOG(1) << "transfer from " << from_account_id << " cancelled before "
            << "locking";
    return kCancelled;
  }

  int ret = 0;
  {
    util::LockGuard lock(&mu_);
    Log("acquired lock", from_account_id, amount);
    if (observer_ != nullptr) {
      observer_->OnAcquired(from_account_id, amount);
    }

    if (cancel != nullptr && cancel->IsCancelled()) {
      VLOG(1) << "transfer from " << from_account_id << " cancelled before "
              << "debiting";
      ret = kCancelled;
    } else {
      mu_.AssertHeld();
      ret = pair_.Transfer(from_account_id, amount, delay_ms, observer_,
                           balances, violation);
    }

    if (observer_ != nullptr) {
      observer_->OnReleasing(from_account_id, amount);
    }
  }
  Log("released lock", from_account_id, amount);

  VLOG(2) << "transfer from " << from_account_id << " amount " << amount
          << " returned " << ErrorName(ret);
  return ret;
}

void TransferCoordinator::Log(const char* event, int from_account_id,
                              int64_t amount) {
  std::ostringstream oss;
  oss << "thread " << util::CurrentThreadName() << " " << event << " from "
      << from_account_id << " amount " << amount;
  logger_->Append(oss.str());
}

}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
