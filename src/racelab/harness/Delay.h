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
// Delays injected into a worker cycle.  The delay between a read and the
// following write widens the window in which another worker can interleave;
// it does not create the window, which exists with or without it.

#pragma once

#include <stdint.h>

#include <functional>
#include <random>

#include "util/common.h"

namespace racelab {
namespace harness {

class Delay {
 public:
  virtual ~Delay() {}
  virtual void Wait() = 0;
};

class NoDelay : public Delay {
 public:
  void Wait() override {}
};

// Sleeps a uniformly distributed number of microseconds in
// [min_ms, max_ms] milliseconds, so repeated runs interleave differently.
class RandomDelay : public Delay {
 public:
  RandomDelay(int min_ms, int max_ms, unsigned seed);

  void Wait() override;

  // Draws the length of the next sleep, in microseconds.
  int64_t NextMicros();

  int min_ms() const { return min_ms_; }
  int max_ms() const { return max_ms_; }

 private:
  const int min_ms_;
  const int max_ms_;
  std::default_random_engine rand_eng_;
  std::uniform_int_distribution<int64_t> uni_dist_;

  DISALLOW_COPY_AND_ASSIGN(RandomDelay);
};

// Runs a callback instead of sleeping.  Tests use it to force a specific
// interleaving of two workers.
class CallbackDelay : public Delay {
 public:
  explicit CallbackDelay(std::function<void()> callback)
      : callback_(callback) {}
  void Wait() override { callback_(); }

 private:
  std::function<void()> callback_;
};

// A seed that differs between processes and between calls.
unsigned FreshSeed();

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
