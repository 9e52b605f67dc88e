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
// Cooperative and forceful cancellation of transfers in flight.

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <thread>
#include <type_traits>

#include "account/AccountPair.h"
#include "account/TransferCoordinator.h"
#include "account/TransferTestUtil.h"
#include "harness/DebitLatch.h"
#include "harness/TransferThread.h"
#include "util/cancellation.h"
#include "util/line_logger.h"

namespace twinacct {
namespace harness {
namespace test {

using account::Balances;
using account::InvariantViolation;
using account::kCancelled;
using account::kInvariantViolation;
using account::test::CountEvents;
using account::test::ParseTransferLog;

static const std::chrono::seconds kDebitTimeout(5);

class CancellationTest : public ::testing::Test {
 public:
  CancellationTest()
      : logger_(&log_), coordinator_(10000, 4000, 6000, &logger_, &latch_) {}

 protected:
  void ExpectBalances(int64_t a, int64_t b) {
    int64_t balance = 0;
    EXPECT_EQ(0, coordinator_.GetBalance(1, &balance));
    EXPECT_EQ(a, balance);
    EXPECT_EQ(0, coordinator_.GetBalance(2, &balance));
    EXPECT_EQ(b, balance);
  }

  std::ostringstream log_;
  util::LineLogger logger_;
  DebitLatch latch_;
  account::TransferCoordinator coordinator_;
};

TEST_F(CancellationTest, ForcefulCancellationLeavesPairTorn) {
  auto begin = std::chrono::steady_clock::now();
  TransferThread victim(&coordinator_, 1, 100, 10000);
  ASSERT_EQ(0, victim.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));
  EXPECT_EQ(3900, latch_.last_debit().balance_a);
  EXPECT_EQ(6000, latch_.last_debit().balance_b);

  ASSERT_EQ(0, victim.CancelForcefully());
  bool cancelled = false;
  ASSERT_EQ(0, victim.Join(&cancelled));
  EXPECT_TRUE(cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(9));

  // The mutex was released by unwinding; the credit never happened.
  EXPECT_EQ(9900, coordinator_.TotalBalance());
  ExpectBalances(3900, 6000);

  auto log = ParseTransferLog(log_.str());
  EXPECT_EQ(1, CountEvents(log, "acquired"));
  EXPECT_EQ(0, CountEvents(log, "released"));
}

TEST_F(CancellationTest, TornPairIsDetectedByNextTransfer) {
  TransferThread victim(&coordinator_, 1, 100, 10000);
  ASSERT_EQ(0, victim.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));
  ASSERT_EQ(0, victim.CancelForcefully());
  bool cancelled = false;
  ASSERT_EQ(0, victim.Join(&cancelled));
  ASSERT_TRUE(cancelled);

  Balances balances;
  InvariantViolation violation;
  EXPECT_EQ(kInvariantViolation,
            coordinator_.Transfer(1, 100, 0, &balances, &violation));
  EXPECT_EQ(3900, violation.balance_a);
  EXPECT_EQ(6000, violation.balance_b);
  EXPECT_EQ(10000, violation.expected_total);

  // No self-healing.
  EXPECT_EQ(kInvariantViolation,
            coordinator_.Transfer(2, 100, 0, &balances, &violation));
  EXPECT_EQ(9900, coordinator_.TotalBalance());
  EXPECT_EQ(1, latch_.debits());
}

TEST_F(CancellationTest, TotalBalanceWaitsForTransferInFlight) {
  TransferThread worker(&coordinator_, 1, 100, 300);
  ASSERT_EQ(0, worker.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));
  auto debited = std::chrono::steady_clock::now();

  // The pair sums to 9900 until the worker credits and unlocks.
  EXPECT_EQ(10000, coordinator_.TotalBalance());
  EXPECT_GE(std::chrono::steady_clock::now() - debited,
            std::chrono::milliseconds(100));
  int64_t balance = 0;
  EXPECT_EQ(0, coordinator_.GetBalance(1, &balance));
  EXPECT_EQ(3900, balance);

  bool cancelled = true;
  ASSERT_EQ(0, worker.Join(&cancelled));
  EXPECT_FALSE(cancelled);
  EXPECT_EQ(0, worker.result());
}

TEST_F(CancellationTest, GetBalanceWaitsForTransferInFlight) {
  TransferThread worker(&coordinator_, 1, 100, 300);
  ASSERT_EQ(0, worker.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));
  auto debited = std::chrono::steady_clock::now();

  // Account 2 still holds 6000 until the credit.
  int64_t balance = 0;
  EXPECT_EQ(0, coordinator_.GetBalance(2, &balance));
  EXPECT_EQ(6100, balance);
  EXPECT_GE(std::chrono::steady_clock::now() - debited,
            std::chrono::milliseconds(100));

  bool cancelled = true;
  ASSERT_EQ(0, worker.Join(&cancelled));
  EXPECT_EQ(0, worker.result());
  EXPECT_EQ(10000, coordinator_.TotalBalance());
}

TEST_F(CancellationTest, CooperativeCancellationOfQueuedTransfer) {
  TransferThread slow(&coordinator_, 1, 100, 300);
  ASSERT_EQ(0, slow.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));

  // "slow" holds the mutex for the rest of its delay, so "queued" cannot get
  // past either of its checkpoints before it sees the request.
  TransferThread queued(&coordinator_, 2, 500, 0);
  ASSERT_EQ(0, queued.Start());
  queued.CancelCooperatively();

  bool slow_cancelled = true;
  bool queued_cancelled = true;
  ASSERT_EQ(0, slow.Join(&slow_cancelled));
  ASSERT_EQ(0, queued.Join(&queued_cancelled));
  EXPECT_FALSE(slow_cancelled);
  EXPECT_FALSE(queued_cancelled);
  EXPECT_EQ(0, slow.result());
  EXPECT_EQ(kCancelled, queued.result());

  EXPECT_EQ(10000, coordinator_.TotalBalance());
  ExpectBalances(3900, 6100);
  EXPECT_EQ(1, latch_.debits());

  Balances balances;
  InvariantViolation violation;
  EXPECT_EQ(0, coordinator_.Transfer(2, 100, 0, &balances, &violation));
  ExpectBalances(4000, 6000);
}

TEST_F(CancellationTest, CooperativeCancellationAfterDebitIsIgnored) {
  TransferThread worker(&coordinator_, 2, 1000, 200);
  ASSERT_EQ(0, worker.Start());
  ASSERT_TRUE(latch_.WaitForDebit(kDebitTimeout));
  worker.CancelCooperatively();

  bool cancelled = true;
  ASSERT_EQ(0, worker.Join(&cancelled));
  EXPECT_FALSE(cancelled);
  EXPECT_EQ(0, worker.result());
  EXPECT_EQ(5000, worker.balances().balance_a);
  EXPECT_EQ(5000, worker.balances().balance_b);
  EXPECT_EQ(10000, coordinator_.TotalBalance());

  auto log = ParseTransferLog(log_.str());
  EXPECT_EQ(1, CountEvents(log, "released"));
}

TEST_F(CancellationTest, UncancelledThreadCompletes) {
  TransferThread worker(&coordinator_, 1, 100, 0);
  ASSERT_EQ(0, worker.Start());
  bool cancelled = true;
  ASSERT_EQ(0, worker.Join(&cancelled));
  EXPECT_FALSE(cancelled);
  EXPECT_EQ(0, worker.result());
  EXPECT_EQ(3900, worker.balances().balance_a);
  EXPECT_EQ(6100, worker.balances().balance_b);
}

TEST(HarnessTypesTest, NotCopyable) {
  static_assert(!std::is_copy_constructible<DebitLatch>::value,
                "DebitLatch copies");
  static_assert(!std::is_copy_constructible<TransferThread>::value,
                "TransferThread copies");
  static_assert(!std::is_copy_constructible<util::CancellationFlag>::value,
                "CancellationFlag copies");
  static_assert(!std::is_copy_assignable<util::CancellationFlag>::value,
                "CancellationFlag copies");
}

}  // namespace test
}  // namespace harness
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
