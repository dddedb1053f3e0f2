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
#include "harness/Verification.h"

#include <sstream>
#include <string>
#include <vector>

namespace racelab {
namespace harness {

std::string Verification::Summary() const {
  std::ostringstream oss;
  oss << "initial " << initial << ", expected " << expected << ", actual "
      << actual;
  if (shape == proto::READ_MODIFY_WRITE) {
    oss << ", lost " << lost;
  } else if (shape == proto::BOUNDED_BUFFER) {
    oss << ", produced " << produced << ", consumed " << consumed
        << ", capacity " << capacity << ", rejected " << rejected;
  } else {
    oss << ", succeeded " << succeeded << "/" << attempted << ", rejected "
        << rejected << ", oversold " << oversold;
  }
  oss << (race_detected ? ", RACE DETECTED" : ", no race");
  if (failed_workers > 0) {
    oss << ", " << failed_workers << " worker(s) failed";
  }
  if (inconclusive) {
    oss << ", inconclusive";
  }
  return oss.str();
}

Verification VerifyFinalState(const proto::ScenarioConfig& config,
                              int64_t actual,
                              const std::vector<WorkerOutcome>& outcomes) {
  Verification v;
  v.shape = config.shape();
  v.amount = config.amount();
  v.initial = config.initial_value();
  v.actual = actual;

  int64_t applied_total = 0;
  for (const WorkerOutcome& outcome : outcomes) {
    if (!outcome.ok()) ++v.failed_workers;
    if (!outcome.has_report) {
      v.inconclusive = true;
      continue;
    }
    const proto::WorkerReport& report = outcome.report;
    v.attempted += report.attempted();
    v.succeeded += report.applied();
    v.rejected += report.rejected();
    int64_t units = report.applied() * report.amount();
    applied_total += units;
    if (v.shape != proto::BOUNDED_BUFFER) {
      continue;
    }
    if (report.role() == proto::CONSUMER) {
      v.consumed += units;
    } else {
      v.produced += units;
    }
  }

  if (v.shape == proto::READ_MODIFY_WRITE) {
    v.expected = v.initial + applied_total;
    v.delta = v.actual - v.expected;
    if (v.delta < 0) {
      v.lost = -v.delta;
    }
  } else if (v.shape == proto::BOUNDED_BUFFER) {
    v.capacity = config.capacity();
    v.expected = v.initial + v.produced - v.consumed;
    v.delta = v.actual - v.expected;
    v.invariant_held = v.actual >= 0 && v.actual <= v.capacity;
  } else {
    v.expected = v.initial - applied_total;
    v.delta = v.actual - v.expected;
    v.invariant_held = v.actual >= 0;
    if (applied_total > v.initial) {
      v.oversold = applied_total - v.initial;
    }
  }
  v.consistent = v.delta == 0;
  v.race_detected = !v.consistent || !v.invariant_held;
  return v;
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
