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
#include <vector>

#include "harness/Harness.h"
#include "proto/Racelab.pb.h"

namespace racelab {
namespace harness {

// Statistics over repeated runs of one scenario.  A single run proves
// little: an unsynchronized run may happen to interleave harmlessly.
struct TrialSummary {
  int trials = 0;
  // Verified runs that detected a race.
  int races = 0;
  // Runs that did not verify, or where some worker failed.
  int failed = 0;
  int inconclusive = 0;
  int64_t min_actual = 0;
  int64_t max_actual = 0;
  // Largest |actual - expected| among verified runs.
  int64_t worst_delta = 0;
  // Final value of every verified run, in order.
  std::vector<int64_t> actuals;

  std::string Summary() const;
};

// Run "config" "trials" times, each in a fresh run directory.
TrialSummary RunTrials(const proto::ScenarioConfig& config, int trials);

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
