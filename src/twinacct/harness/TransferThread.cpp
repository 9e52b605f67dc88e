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
#include "harness/TransferThread.h"

#include <glog/logging.h>
#include <string.h>

namespace twinacct {
namespace harness {

TransferThread::TransferThread(account::TransferCoordinator* coordinator,
                               int from_account_id, int64_t amount,
                               int64_t delay_ms)
    : coordinator_(CHECK_NOTNULL(coordinator)),
      from_account_id_(from_account_id),
      amount_(amount),
      delay_ms_(delay_ms) {}

TransferThread::~TransferThread() {
  if (started_ && !joined_) {
    int ret = Join(nullptr);
    if (ret != 0) {
      LOG(ERROR) << "could not join transfer thread: " << strerror(-ret);
    }
  }
}

int TransferThread::Start() {
  CHECK(!started_) << "transfer thread started twice";
  int ret = pthread_create(&thread_, nullptr, &TransferThread::Run, this);
  if (ret != 0) {
    LOG(ERROR) << "pthread_create failed: " << strerror(ret);
    return -ret;
  }
  started_ = true;
  VLOG(1) << "started transfer from " << from_account_id_ << " amount "
          << amount_ << " delay " << delay_ms_ << "ms";
  return 0;
}

int TransferThread::CancelForcefully() {
  CHECK(started_) << "cancelling a transfer thread that was not started";
  int ret = pthread_cancel(thread_);
  if (ret != 0) {
    LOG(ERROR) << "pthread_cancel failed: " << strerror(ret);
    return -ret;
  }
  VLOG(1) << "forcefully cancelled transfer from " << from_account_id_;
  return 0;
}

int TransferThread::Join(bool* cancelled) {
  CHECK(started_ && !joined_) << "nothing to join";
  void* status = nullptr;
  int ret = pthread_join(thread_, &status);
  if (ret != 0) {
    return -ret;
  }
  joined_ = true;
  if (cancelled != nullptr) {
    *cancelled = (status == PTHREAD_CANCELED);
  }
  return 0;
}

void* TransferThread::Run(void* arg) {
  auto self = static_cast<TransferThread*>(arg);
  int oldstate = 0;
  int oldtype = 0;
  pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &oldstate);
  pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &oldtype);

  self->result_ = self->coordinator_->Transfer(
      self->from_account_id_, self->amount_, self->delay_ms_,
      &self->balances_, &self->violation_, &self->cancel_);
  return nullptr;
}

}  // namespace harness
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
