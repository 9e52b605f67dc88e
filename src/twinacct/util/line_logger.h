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
// An append-only writer of timestamped lines that can be shared by many
// threads.

#pragma once

#include <stdint.h>

#include <boost/noncopyable.hpp>

#include <mutex>
#include <ostream>
#include <string>

#include "port/thread_annotations.h"

namespace twinacct {
namespace util {

// LineLogger is thread-safe.  Every Append() is written as one whole line and
// flushed before Append() returns, so lines of concurrent callers interleave
// only at line boundaries.
class LineLogger : private boost::noncopyable {
 public:
  // "out" is not owned and must outlive the logger.
  explicit LineLogger(std::ostream* out);

  // Writes "<timestamp> <line>\n".  The timestamp is taken when Append() is
  // called, before waiting for other writers.
  void Append(const std::string& line);

  uint64_t lines_written() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_written_;
  }

 private:
  std::mutex mutex_;
  std::ostream* const out_ PT_GUARDED_BY(mutex_);
  uint64_t lines_written_ GUARDED_BY(mutex_) = 0;
};

}  // namespace util
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
