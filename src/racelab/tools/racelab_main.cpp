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
// racelab runs a scenario without synchronization, with the file lock, or
// both, and prints what it observed.  For example:
//
//   racelab --scenario=bank --mode=both
//   racelab --scenario=counter --mode=race --trials=10 --workers=8
//   racelab --scenario=buffer --store=sqlite --consumers=1
//   racelab --scenario_file=tickets.scenario --colorlogtostderr

#include <sysexits.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "harness/Harness.h"
#include "harness/Scenario.h"
#include "harness/Trials.h"
#include "lock/FileMutex.h"
#include "proto/Racelab.pb.h"

DEFINE_string(scenario, "counter", "preset to run: counter, bank, inventory or buffer");
DEFINE_string(scenario_file, "",
              "ScenarioConfig in protobuf text format; replaces --scenario");
DEFINE_string(mode, "both", "race, locked or both");
DEFINE_int32(trials, 1, "number of runs per mode");

// Overrides of the scenario, applied only when given on the command line.
DEFINE_int32(workers, 5, "number of workers");
DEFINE_int32(repetitions, 20, "operations per worker");
DEFINE_int64(amount, 1, "increment or withdrawal per operation");
DEFINE_int64(initial_value, 0, "starting value of the resource");
DEFINE_int32(delay_min_ms, 0, "lower bound of the read-to-write delay");
DEFINE_int32(delay_max_ms, 10, "upper bound of the read-to-write delay");
DEFINE_string(act_policy, "ACT_ON_CURRENT_VALUE",
              "ACT_ON_CURRENT_VALUE or ACT_ON_CHECKED_VALUE");
DEFINE_string(launcher, "process", "process or thread");
DEFINE_string(store, "file",
              "file, or sqlite to keep the record in a database whose "
              "transactions replace the file lock");
DEFINE_int64(capacity, 5, "size of the bounded buffer");
DEFINE_int32(consumers, 0, "workers of the bounded buffer that consume");
DEFINE_string(work_dir, "/tmp", "where run directories are created");
DEFINE_string(worker_binary, "",
              "racelab_worker executable for process workers; empty runs "
              "workers in forked children");
DEFINE_int32(worker_timeout_ms, 0, "kill workers running longer; 0 waits");

using racelab::harness::DescribeScenario;
using racelab::harness::RunResult;
using racelab::harness::TrialSummary;
using racelab::proto::ScenarioConfig;

namespace {

bool IsSet(const char* flag) {
  return !gflags::GetCommandLineFlagInfoOrDie(flag).is_default;
}

bool ApplyOverrides(ScenarioConfig* config) {
  if (IsSet("workers")) config->set_workers(FLAGS_workers);
  if (IsSet("repetitions")) config->set_repetitions(FLAGS_repetitions);
  if (IsSet("amount")) config->set_amount(FLAGS_amount);
  if (IsSet("initial_value")) config->set_initial_value(FLAGS_initial_value);
  if (IsSet("delay_min_ms")) config->set_delay_min_ms(FLAGS_delay_min_ms);
  if (IsSet("delay_max_ms")) config->set_delay_max_ms(FLAGS_delay_max_ms);
  if (IsSet("capacity")) config->set_capacity(FLAGS_capacity);
  if (IsSet("consumers")) config->set_consumers(FLAGS_consumers);
  if (IsSet("work_dir")) config->set_work_dir(FLAGS_work_dir);
  if (IsSet("worker_binary")) config->set_worker_binary(FLAGS_worker_binary);
  if (IsSet("worker_timeout_ms")) {
    config->set_worker_timeout_ms(FLAGS_worker_timeout_ms);
  }
  if (IsSet("lock_max_attempts")) {
    config->set_lock_max_attempts(FLAGS_lock_max_attempts);
  }
  if (IsSet("lock_retry_delay_ms")) {
    config->set_lock_retry_delay_ms(FLAGS_lock_retry_delay_ms);
  }
  if (IsSet("act_policy")) {
    racelab::proto::ActPolicy policy;
    if (!racelab::proto::ActPolicy_Parse(FLAGS_act_policy, &policy)) {
      LOG(ERROR) << "unknown --act_policy " << FLAGS_act_policy;
      return false;
    }
    config->set_act_policy(policy);
  }
  if (IsSet("launcher")) {
    if (FLAGS_launcher == "process") {
      config->set_launcher(racelab::proto::PROCESS);
    } else if (FLAGS_launcher == "thread") {
      config->set_launcher(racelab::proto::THREAD);
    } else {
      LOG(ERROR) << "unknown --launcher " << FLAGS_launcher;
      return false;
    }
  }
  if (IsSet("store")) {
    if (FLAGS_store == "file") {
      config->set_store(racelab::proto::FILE_STORE);
    } else if (FLAGS_store == "sqlite") {
      config->set_store(racelab::proto::SQLITE_STORE);
    } else {
      LOG(ERROR) << "unknown --store " << FLAGS_store;
      return false;
    }
  }
  return true;
}

void PrintBox(const std::string& title, const std::string& body) {
  std::vector<std::string> lines;
  std::istringstream iss(body);
  std::string line;
  size_t width = title.size();
  while (std::getline(iss, line)) {
    width = std::max(width, line.size());
    lines.push_back(line);
  }
  std::string rule = "+" + std::string(width + 2, '-') + "+";
  std::cout << rule << "\n";
  std::cout << "| " << title << std::string(width - title.size(), ' ')
            << " |\n";
  std::cout << rule << "\n";
  for (const std::string& l : lines) {
    std::cout << "| " << l << std::string(width - l.size(), ' ') << " |\n";
  }
  std::cout << rule << std::endl;
}

// Returns true if the runs behaved.
bool RunMode(ScenarioConfig config, bool synchronized) {
  config.set_synchronized(synchronized);
  std::string title = DescribeScenario(config);

  if (FLAGS_trials == 1) {
    RunResult result = racelab::harness::RunScenario(config);
    if (!result.output.empty()) {
      PrintBox(title, result.output);
    }
    std::cout << result.message << std::endl;
    if (!result.error.empty()) {
      std::cout << "error: " << result.error << std::endl;
    }
    return result.success;
  }

  TrialSummary summary = racelab::harness::RunTrials(config, FLAGS_trials);
  std::ostringstream body;
  body << "trials:    " << summary.trials << "\n";
  body << "races:     " << summary.races << "\n";
  body << "failed:    " << summary.failed << "\n";
  body << "range:     [" << summary.min_actual << ", " << summary.max_actual
       << "]\n";
  body << "worst:     " << summary.worst_delta;
  PrintBox(title, body.str());
  std::cout << summary.Summary() << std::endl;
  return summary.failed == 0 && (!synchronized || summary.races == 0);
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "racelab [--scenario=counter|bank|inventory|buffer] "
      "[--mode=race|locked|both] [--store=file|sqlite]");
  FLAGS_logtostderr = true;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  ScenarioConfig config;
  if (!FLAGS_scenario_file.empty()) {
    if (racelab::harness::LoadScenarioFile(FLAGS_scenario_file, &config) < 0) {
      return EX_DATAERR;
    }
  } else if (!racelab::harness::GetPreset(FLAGS_scenario, &config)) {
    LOG(ERROR) << "unknown --scenario " << FLAGS_scenario;
    return EX_USAGE;
  }
  if (!ApplyOverrides(&config)) {
    return EX_USAGE;
  }
  if (FLAGS_mode != "race" && FLAGS_mode != "locked" && FLAGS_mode != "both") {
    LOG(ERROR) << "unknown --mode " << FLAGS_mode;
    return EX_USAGE;
  }
  if (FLAGS_trials < 1) {
    LOG(ERROR) << "--trials must be positive";
    return EX_USAGE;
  }
  std::string why;
  if (!racelab::harness::ValidateScenario(config, &why)) {
    LOG(ERROR) << why;
    return EX_USAGE;
  }

  bool ok = true;
  if (FLAGS_mode == "race" || FLAGS_mode == "both") {
    ok = RunMode(config, false) && ok;
  }
  if (FLAGS_mode == "locked" || FLAGS_mode == "both") {
    ok = RunMode(config, true) && ok;
  }
  return ok ? 0 : 1;
}

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
