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
#include "harness/Delay.h"

#include <unistd.h>

#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace racelab {
namespace harness {

RandomDelay::RandomDelay(int min_ms, int max_ms, unsigned seed)
    : min_ms_(min_ms), max_ms_(max_ms), rand_eng_(seed) {
  CHECK_GE(min_ms_, 0);
  CHECK_LE(min_ms_, max_ms_) << "bad delay range";
  uni_dist_ = std::uniform_int_distribution<int64_t>(
      static_cast<int64_t>(min_ms_) * 1000,
      static_cast<int64_t>(max_ms_) * 1000);
}

int64_t RandomDelay::NextMicros() {
  return uni_dist_(rand_eng_);
}

void RandomDelay::Wait() {
  if (max_ms_ == 0) return;
  std::this_thread::sleep_for(std::chrono::microseconds(NextMicros()));
}

unsigned FreshSeed() {
  static std::atomic<unsigned> calls(0);
  return static_cast<unsigned>(util::NowMicros()) ^
         (static_cast<unsigned>(getpid()) << 16) ^ (calls++ * 2654435761u);
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
