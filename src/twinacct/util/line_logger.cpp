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
#include "util/line_logger.h"

#include <glog/logging.h>

#include "util/common.h"

namespace twinacct {
namespace util {

LineLogger::LineLogger(std::ostream* out) : out_(CHECK_NOTNULL(out)) {}

void LineLogger::Append(const std::string& line) {
  const std::string stamp = FormatTimestamp(NowMicros());
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << stamp << ' ' << line << '\n';
  out_->flush();
  if (!out_->good()) {
    LOG(ERROR) << "failed to append to transfer log: " << line;
    return;
  }
  ++lines_written_;
}

}  // namespace util
}  // namespace twinacct

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
