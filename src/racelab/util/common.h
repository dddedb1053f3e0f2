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

#define DISALLOW_COPY_AND_ASSIGN(T) \
  T(const T&); \
  void operator=(const T&)

namespace racelab {
namespace util {

uint64_t NowMicros();

// Identity of the calling process as text, e.g. "4242".
std::string ProcessToken();

// Identity of a worker that shares its process with other workers, e.g.
// "4242-w3".
std::string WorkerToken(const std::string& worker_id);

}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
