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
// Certifies the final value of a harness run against what the workers
// reported to have done.

#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "harness/Worker.h"
#include "proto/Racelab.pb.h"

namespace racelab {
namespace harness {

struct Verification {
  proto::OperationShape shape = proto::READ_MODIFY_WRITE;
  int64_t amount = 0;
  int64_t initial = 0;
  int64_t actual = 0;
  // initial + applied * amount for increments, initial - applied * amount
  // for check-then-act, initial + produced - consumed for a bounded buffer.
  // Counts only operations that workers reported.
  int64_t expected = 0;
  // actual - expected.
  int64_t delta = 0;

  int attempted = 0;
  int succeeded = 0;
  int rejected = 0;

  // expected - actual when the record fell short: the value of the
  // increments overwritten by a concurrent writer.
  int64_t lost = 0;
  // Units handed out beyond what the resource held initially.
  int64_t oversold = 0;
  // Bounded buffer only: units reported put in and taken out.
  int64_t capacity = 0;
  int64_t produced = 0;
  int64_t consumed = 0;
  // actual >= 0 for check-then-act, 0 <= actual <= capacity for a bounded
  // buffer; always true for increments.
  bool invariant_held = true;
  // actual == expected.
  bool consistent = true;
  bool race_detected = false;

  int failed_workers = 0;
  // Some worker left no report, so "expected" misses its contribution.
  bool inconclusive = false;

  // One line for logs.
  std::string Summary() const;
};

Verification VerifyFinalState(const proto::ScenarioConfig& config,
                              int64_t actual,
                              const std::vector<WorkerOutcome>& outcomes);

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
