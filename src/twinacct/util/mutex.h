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
//
// Adapted from http://clang.llvm.org/docs/ThreadSafetyAnalysis.html

#pragma once

#include <boost/noncopyable.hpp>
#include <glog/logging.h>

#include <mutex>
#include <thread>

#include "port/thread_annotations.h"

namespace twinacct {
namespace util {

// An annotated exclusive mutex that remembers which thread holds it.
// It is not re-entrant: locking it twice from the same thread deadlocks.
class CAPABILITY("mutex") Mutex : private boost::noncopyable {
 public:
  Mutex() {}

  // Acquire/lock this mutex exclusively.  Only one thread can have exclusive
  // access at any one time.  Blocks until the mutex is available.
  void Lock() ACQUIRE() {
    mu_.lock();
    owner_ = std::this_thread::get_id();
  }

  // Release/unlock an exclusive mutex.  The owner is cleared before the
  // underlying mutex is released so that the next holder's id is never
  // overwritten.
  void Unlock() RELEASE() {
    owner_ = std::thread::id();
    mu_.unlock();
  }

  // Dies if this mutex is not currently held by the calling thread.
  void AssertHeld() const ASSERT_CAPABILITY(this) {
    CHECK(owner_ == std::this_thread::get_id())
        << "mutex is not held by thread " << std::this_thread::get_id();
  }

 private:
  std::mutex mu_;
  std::thread::id owner_;
};

// LockGuard is an RAII class that acquires a mutex in its constructor, and
// releases it in its destructor.  The destructor also runs when the owning
// thread is unwound by pthread_cancel(), so a cancelled holder never leaves
// the mutex locked.
class SCOPED_CAPABILITY LockGuard : private boost::noncopyable {
 public:
  explicit LockGuard(Mutex* mu) ACQUIRE(mu) : mu_(mu) {
    mu_->Lock();
  }
  ~LockGuard() RELEASE() {
    mu_->Unlock();
  }

 private:
  Mutex* const mu_;
};

}  // namespace util
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
