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
// Helpers shared by the account and harness tests.

#pragma once

#include <gmock/gmock.h>

#include <sstream>
#include <string>
#include <vector>

#include "account/TransferObserver.h"

namespace twinacct {
namespace account {
namespace test {

class MockTransferObserver : public TransferObserver {
 public:
  MOCK_METHOD2(OnAcquired, void(int from_account_id, int64_t amount));
  MOCK_METHOD3(OnDebited, void(int from_account_id, int64_t amount,
                               const Balances& balances));
  MOCK_METHOD2(OnReleasing, void(int from_account_id, int64_t amount));
};

// One line of the transfer log, e.g.
//   "2026-10-19T10:00:00.000001 thread 1402 acquired lock from 1 amount 100"
struct LogLine {
  std::string thread;
  std::string event;  // "called", "acquired", or "released"
  int from_account_id = 0;
  int64_t amount = 0;
};

inline std::vector<LogLine> ParseTransferLog(const std::string& text) {
  std::vector<LogLine> result;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream words(line);
    std::string stamp, thread_word, noun, from_word, amount_word;
    LogLine parsed;
    words >> stamp >> thread_word >> parsed.thread >> parsed.event >> noun >>
        from_word >> parsed.from_account_id >> amount_word >> parsed.amount;
    result.push_back(parsed);
  }
  return result;
}

inline int CountEvents(const std::vector<LogLine>& log,
                       const std::string& event) {
  int n = 0;
  for (const auto& l : log) {
    if (l.event == event) ++n;
  }
  return n;
}

}  // namespace test
}  // namespace account
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
