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
// The Harness runs one scenario once:
//
//   INIT -> SPAWNED -> AWAITING_COMPLETION -> VERIFIED -> TORN_DOWN
//
// Any step before verification may move it to FAILED instead.  Teardown is
// allowed from every state, and happens in the destructor if nobody asked for
// it, so a run never leaves its resource or lock marker behind.
//
// All artifacts of a run live in its run directory:
//
//   <run_dir>/<name>.resource    the contended record, or
//   <run_dir>/<name>.db          the database holding it
//   <run_dir>/<name>.lock        the lock marker, while held
//   <run_dir>/worker-N.report    reports of finished worker processes

#pragma once

#include <stdint.h>

#include <boost/noncopyable.hpp>

#include <memory>
#include <string>
#include <vector>

#include "harness/Launcher.h"
#include "harness/Verification.h"
#include "harness/Worker.h"
#include "lock/FileMutex.h"
#include "proto/Racelab.pb.h"
#include "store/ResourceStore.h"

namespace racelab {
namespace harness {

enum class HarnessState {
  INIT,
  SPAWNED,
  AWAITING_COMPLETION,
  VERIFIED,
  TORN_DOWN,
  FAILED,
};

const char* HarnessStateName(HarnessState state);

// The only thing a front end needs from a run.
struct RunResult {
  bool success = false;
  std::string message;
  // Human-readable summary of the verification.  Empty if the run never got
  // that far.
  std::string output;
  // Empty on success.
  std::string error;

  bool verified = false;
  Verification verification;
};

class Harness : private boost::noncopyable {
 public:
  Harness(const proto::ScenarioConfig& config, const std::string& run_dir,
          std::unique_ptr<store::ResourceStore> store,
          std::unique_ptr<Launcher> launcher);
  ~Harness();

  /**
   * Create the run directory and (re)initialize the record, overwriting
   * anything a previous run left behind.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  int Initialize(int64_t start_value);

  /**
   * Launch every worker and wait for all of them.  A failing worker does not
   * fail the run.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  int Run();

  /**
   * Read the final record and compare it with what the workers reported.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  int Verify(Verification* verification);

  // Remove the record, the lock marker and the run directory.
  int Teardown();

  // Initialize, run, verify and tear down, on every path.
  RunResult Execute();

  WorkerSpec SpecFor(int index) const;

  // Retry policy of the run's lock, taken from the scenario.
  lock::RetryPolicy LockPolicy() const;

  HarnessState state() const { return state_; }
  const std::vector<WorkerOutcome>& outcomes() const { return outcomes_; }
  const std::string& run_dir() const { return run_dir_; }
  const proto::ScenarioConfig& config() const { return config_; }

  static std::string ResourcePath(const std::string& run_dir,
                                  const std::string& name) {
    return run_dir + "/" + name + ".resource";
  }
  static std::string DatabasePath(const std::string& run_dir,
                                  const std::string& name) {
    return run_dir + "/" + name + ".db";
  }

 private:
  void Fail(const std::string& why);

  const proto::ScenarioConfig config_;
  const std::string run_dir_;
  std::unique_ptr<store::ResourceStore> store_;
  std::unique_ptr<Launcher> launcher_;

  HarnessState state_ = HarnessState::INIT;
  bool initialized_ = false;
  std::vector<WorkerOutcome> outcomes_;
  std::string failure_;
};

/**
 * Run "config" once in a fresh sub-directory of config.work_dir, with the
 * store and the launcher the config asks for.
 */
RunResult RunScenario(const proto::ScenarioConfig& config);

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
