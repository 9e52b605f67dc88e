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
// Runs the two-account scenarios and reports whether each one behaved as
// documented.  The transfer log goes to stdout unless --transfer_log is set.

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "account/AccountPair.h"
#include "account/TransferCoordinator.h"
#include "harness/DebitLatch.h"
#include "harness/TransferThread.h"
#include "util/line_logger.h"

DEFINE_string(scenario, "all",
              "sanity, mismatch, concurrent, cooperative, forceful, or all");
DEFINE_int64(balance_a, 4000, "initial balance of account 1");
DEFINE_int64(balance_b, 6000, "initial balance of account 2");
DEFINE_int64(recorded_total, -1,
             "recorded invariant total; -1 means balance_a + balance_b");
DEFINE_int64(amount, 100, "amount of each transfer");
DEFINE_int64(delay_ms, 1000, "sleep between the debit and the credit");
DEFINE_int32(threads, 4, "number of concurrent transfers");
DEFINE_string(transfer_log, "", "file of the transfer log; empty for stdout");

using twinacct::account::Balances;
using twinacct::account::ErrorName;
using twinacct::account::InvariantViolation;
using twinacct::account::TransferCoordinator;
using twinacct::account::kCancelled;
using twinacct::account::kInvariantViolation;
using twinacct::harness::DebitLatch;
using twinacct::harness::TransferThread;
using twinacct::util::LineLogger;

namespace {

// The mismatch scenario records this much less than the initial balances.
const int64_t kMismatchShortfall = 1000;

// main() rejects balances whose sum does not fit.
int64_t InitialTotal() {
  int64_t total = 0;
  CHECK(!__builtin_add_overflow(FLAGS_balance_a, FLAGS_balance_b, &total));
  return total;
}

int64_t RecordedTotal() {
  return FLAGS_recorded_total >= 0 ? FLAGS_recorded_total : InitialTotal();
}

bool ValidateBalances() {
  int64_t total = 0;
  if (__builtin_add_overflow(FLAGS_balance_a, FLAGS_balance_b, &total) ||
      __builtin_sub_overflow(total, kMismatchShortfall, &total)) {
    LOG(ERROR) << "--balance_a=" << FLAGS_balance_a << " and --balance_b="
               << FLAGS_balance_b << " overflow int64";
    return false;
  }
  return true;
}

void PrintBalances(TransferCoordinator* pair) {
  int64_t a = 0;
  int64_t b = 0;
  CHECK_EQ(0, pair->GetBalance(1, &a));
  CHECK_EQ(0, pair->GetBalance(2, &b));
  LOG(INFO) << "balance_a=" << a << " balance_b=" << b
            << " total=" << pair->TotalBalance();
}

bool RunSanity(LineLogger* logger) {
  TransferCoordinator pair(RecordedTotal(), FLAGS_balance_a, FLAGS_balance_b,
                           logger);
  PrintBalances(&pair);
  Balances balances;
  InvariantViolation violation;
  int ret = pair.Transfer(1, FLAGS_amount, FLAGS_delay_ms, &balances,
                          &violation);
  if (ret != 0) {
    LOG(WARNING) << "transfer failed: " << ErrorName(ret);
    return false;
  }
  LOG(INFO) << "transfer returned balance_a=" << balances.balance_a
            << " balance_b=" << balances.balance_b;
  PrintBalances(&pair);
  return pair.TotalBalance() == RecordedTotal();
}

bool RunMismatch(LineLogger* logger) {
  const int64_t recorded = InitialTotal() - kMismatchShortfall;
  TransferCoordinator pair(recorded, FLAGS_balance_a, FLAGS_balance_b, logger);
  Balances balances;
  InvariantViolation violation;
  int ret = pair.Transfer(1, FLAGS_amount, FLAGS_delay_ms, &balances,
                          &violation);
  if (ret != kInvariantViolation) {
    LOG(WARNING) << "expected InvariantViolation but got " << ErrorName(ret);
    return false;
  }
  LOG(INFO) << "found wrong total " << pair.TotalBalance() << " - expecting "
            << violation.expected_total << " (balance_a="
            << violation.balance_a << " balance_b=" << violation.balance_b
            << ")";
  return true;
}

bool RunConcurrent(LineLogger* logger) {
  TransferCoordinator pair(RecordedTotal(), FLAGS_balance_a, FLAGS_balance_b,
                           logger);
  std::vector<std::unique_ptr<TransferThread>> threads;
  for (int i = 0; i < FLAGS_threads; ++i) {
    threads.emplace_back(new TransferThread(&pair, i % 2 + 1, FLAGS_amount,
                                            FLAGS_delay_ms));
    if (threads.back()->Start() != 0) {
      threads.pop_back();
      break;
    }
  }
  bool ok = true;
  for (auto& t : threads) {
    bool cancelled = false;
    if (t->Join(&cancelled) != 0 || cancelled || t->result() != 0) {
      LOG(WARNING) << "a concurrent transfer failed: "
                   << ErrorName(t->result());
      ok = false;
    }
  }
  PrintBalances(&pair);
  return ok && pair.TotalBalance() == RecordedTotal();
}

bool RunCooperative(LineLogger* logger) {
  DebitLatch latch;
  TransferCoordinator pair(RecordedTotal(), FLAGS_balance_a, FLAGS_balance_b,
                           logger, &latch);
  TransferThread slow(&pair, 1, FLAGS_amount, FLAGS_delay_ms);
  if (slow.Start() != 0) return false;
  if (!latch.WaitForDebit(std::chrono::milliseconds(FLAGS_delay_ms + 5000))) {
    LOG(WARNING) << "slow transfer never debited";
    return false;
  }

  // Queued behind "slow", which holds the mutex for the rest of its delay;
  // cancelled before it can get the mutex.
  TransferThread queued(&pair, 2, FLAGS_amount, 0);
  if (queued.Start() != 0) return false;
  queued.CancelCooperatively();

  bool slow_cancelled = false;
  bool queued_cancelled = false;
  if (slow.Join(&slow_cancelled) != 0 || queued.Join(&queued_cancelled) != 0) {
    return false;
  }
  LOG(INFO) << "queued transfer returned " << ErrorName(queued.result());
  PrintBalances(&pair);
  return queued.result() == kCancelled && slow.result() == 0 &&
         pair.TotalBalance() == RecordedTotal();
}

bool RunForceful(LineLogger* logger) {
  DebitLatch latch;
  TransferCoordinator pair(RecordedTotal(), FLAGS_balance_a, FLAGS_balance_b,
                           logger, &latch);
  TransferThread victim(&pair, 1, FLAGS_amount, FLAGS_delay_ms);
  if (victim.Start() != 0) return false;
  if (!latch.WaitForDebit(std::chrono::milliseconds(FLAGS_delay_ms + 5000))) {
    LOG(WARNING) << "transfer never debited";
    return false;
  }
  if (victim.CancelForcefully() != 0) return false;
  bool cancelled = false;
  if (victim.Join(&cancelled) != 0) return false;
  LOG(INFO) << "transfer thread cancelled: " << std::boolalpha << cancelled;
  PrintBalances(&pair);

  Balances balances;
  InvariantViolation violation;
  int ret = pair.Transfer(1, FLAGS_amount, 0, &balances, &violation);
  LOG(INFO) << "next transfer returned " << ErrorName(ret);
  if (ret == kInvariantViolation) {
    LOG(INFO) << "found wrong total " << pair.TotalBalance()
              << " - expecting " << violation.expected_total;
  }
  return cancelled && ret == kInvariantViolation;
}

struct Scenario {
  const char* name;
  bool (*run)(LineLogger* logger);
};

const Scenario kScenarios[] = {
  {"sanity", &RunSanity},
  {"mismatch", &RunMismatch},
  {"concurrent", &RunConcurrent},
  {"cooperative", &RunCooperative},
  {"forceful", &RunForceful},
};

}  // anonymous namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("twinacct_demo [--scenario=NAME] [flags]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  if (!ValidateBalances()) {
    return 1;
  }

  std::ofstream file;
  std::ostream* out = &std::cout;
  if (!FLAGS_transfer_log.empty()) {
    file.open(FLAGS_transfer_log, std::ios::out | std::ios::app);
    if (!file) {
      LOG(ERROR) << "could not open transfer log " << FLAGS_transfer_log;
      return 1;
    }
    out = &file;
  }
  LineLogger logger(out);

  bool known = false;
  bool all_ok = true;
  for (const auto& scenario : kScenarios) {
    if (FLAGS_scenario != "all" && FLAGS_scenario != scenario.name) continue;
    known = true;
    LOG(INFO) << "=== scenario " << scenario.name;
    bool ok = scenario.run(&logger);
    LOG(INFO) << "=== scenario " << scenario.name << ": "
              << (ok ? "as expected" : "UNEXPECTED");
    all_ok = all_ok && ok;
  }
  if (!known) {
    LOG(ERROR) << "unknown scenario: " << FLAGS_scenario;
    return 1;
  }
  return all_ok ? 0 : 1;
}

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
