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
#include "util/common.h"

#include <stdio.h>
#include <time.h>

#include <chrono>
#include <sstream>
#include <thread>

namespace twinacct {
namespace util {

uint64_t NowMicros() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatTimestamp(uint64_t micros) {
  time_t seconds = static_cast<time_t>(micros / 1000000);
  struct tm local;
  localtime_r(&seconds, &local);

  char buf[64];
  size_t len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
  snprintf(buf + len, sizeof(buf) - len, ".%06u",
           static_cast<unsigned>(micros % 1000000));
  return buf;
}

std::string CurrentThreadName() {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

}  // namespace util
}  // namespace twinacct

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
