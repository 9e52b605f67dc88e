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

#include <stdint.h>

#include <string>

namespace twinacct {
namespace util {

// Microseconds since the Unix epoch, from the wall clock.
uint64_t NowMicros();

// Formats "micros" (as returned by NowMicros) in local time as
// "YYYY-MM-DDTHH:MM:SS.uuuuuu".
std::string FormatTimestamp(uint64_t micros);

// Returns a printable id of the calling thread.
std::string CurrentThreadName();

}  // namespace util
}  // namespace twinacct

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
