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
#include "harness/Trials.h"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>
#include <string>

namespace racelab {
namespace harness {

std::string TrialSummary::Summary() const {
  std::ostringstream oss;
  oss << races << " of " << trials << " trial(s) detected a race";
  if (!actuals.empty()) {
    oss << "; final value in [" << min_actual << ", " << max_actual
        << "], worst deviation " << worst_delta;
  }
  if (failed > 0) oss << "; " << failed << " failed";
  if (inconclusive > 0) oss << "; " << inconclusive << " inconclusive";
  return oss.str();
}

TrialSummary RunTrials(const proto::ScenarioConfig& config, int trials) {
  CHECK_GT(trials, 0);
  TrialSummary summary;
  for (int i = 0; i < trials; ++i) {
    RunResult result = RunScenario(config);
    ++summary.trials;
    VLOG(1) << "trial " << i + 1 << "/" << trials << ": " << result.message;
    if (!result.verified) {
      ++summary.failed;
      LOG(ERROR) << "trial " << i + 1 << " failed: " << result.error;
      continue;
    }
    const Verification& v = result.verification;
    if (v.failed_workers > 0) ++summary.failed;
    if (v.inconclusive) ++summary.inconclusive;
    if (v.race_detected) ++summary.races;
    if (summary.actuals.empty()) {
      summary.min_actual = summary.max_actual = v.actual;
    }
    summary.min_actual = std::min(summary.min_actual, v.actual);
    summary.max_actual = std::max(summary.max_actual, v.actual);
    summary.worst_delta =
        std::max(summary.worst_delta, v.delta < 0 ? -v.delta : v.delta);
    summary.actuals.push_back(v.actual);
  }
  LOG(INFO) << config.name() << ": " << summary.Summary();
  return summary;
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
