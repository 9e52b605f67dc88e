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
#pragma once

#include <boost/noncopyable.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "account/TransferObserver.h"
#include "port/thread_annotations.h"

namespace twinacct {
namespace harness {

// A TransferObserver that lets another thread wait until a transfer has
// debited its source account, i.e., until the transfer is parked in its delay
// with the pair torn.
class DebitLatch : public account::TransferObserver,
                   private boost::noncopyable {
 public:
  DebitLatch() {}

  void OnDebited(int from_account_id, int64_t amount,
                 const account::Balances& balances) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++debits_;
    last_debit_ = balances;
    debited_.notify_all();
  }

  // Returns false if no debit happened within "timeout".
  bool WaitForDebit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return debited_.wait_for(lock, timeout, [this] { return debits_ > 0; });
  }

  account::Balances last_debit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_debit_;
  }

  int debits() {
    std::lock_guard<std::mutex> lock(mutex_);
    return debits_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable debited_;
  int debits_ GUARDED_BY(mutex_) = 0;
  account::Balances last_debit_ GUARDED_BY(mutex_);
};

}  // namespace harness
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
