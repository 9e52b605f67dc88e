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
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <type_traits>
#include <vector>

#include "util/mutex.h"

namespace twinacct {
namespace util {
namespace test {

TEST(MutexTest, LockBlocksUntilUnlocked) {
  Mutex mu;
  std::atomic_bool acquired(false);
  mu.Lock();
  std::thread t([&mu, &acquired] {
    LockGuard lock(&mu);
    acquired = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired);
  mu.Unlock();
  t.join();
  EXPECT_TRUE(acquired);
}

TEST(MutexTest, AssertHeldPassesForHolder) {
  Mutex mu;
  LockGuard lock(&mu);
  mu.AssertHeld();
}

TEST(MutexDeathTest, AssertHeldDiesForOthers) {
  Mutex mu;
  EXPECT_DEATH(mu.AssertHeld(), "mutex is not held");
}

TEST(MutexTest, LockGuardReleasesAtScopeExit) {
  Mutex mu;
  {
    LockGuard lock(&mu);
    mu.AssertHeld();
  }
  // Would hang if the guard had left the mutex locked.
  std::thread t([&mu] {
    LockGuard lock(&mu);
    mu.AssertHeld();
  });
  t.join();
}

TEST(MutexDeathTest, AssertHeldDiesAfterUnlock) {
  Mutex mu;
  mu.Lock();
  mu.Unlock();
  EXPECT_DEATH(mu.AssertHeld(), "mutex is not held");
}

TEST(MutexTest, NotCopyable) {
  static_assert(!std::is_copy_constructible<Mutex>::value, "Mutex copies");
  static_assert(!std::is_copy_assignable<Mutex>::value, "Mutex copies");
  static_assert(!std::is_copy_constructible<LockGuard>::value,
                "LockGuard copies");
  static_assert(!std::is_copy_assignable<LockGuard>::value,
                "LockGuard copies");
}

TEST(MutexTest, GuardsCounterAcrossThreads) {
  const int kThreads = 8;
  const int kIncrements = 10000;
  Mutex mu;
  int counter = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&mu, &counter] {
      for (int j = 0; j < kIncrements; ++j) {
        LockGuard lock(&mu);
        ++counter;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(kThreads * kIncrements, counter);
}

}  // namespace test
}  // namespace util
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
