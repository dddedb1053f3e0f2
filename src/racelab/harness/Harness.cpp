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
#include "harness/Harness.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <glog/logging.h>

#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "harness/Scenario.h"
#include "lock/FileMutex.h"
#include "util/fileutil.h"

namespace racelab {
namespace harness {

namespace {

// Tears down a harness when going out of scope.
class ScopedTeardown {
 public:
  explicit ScopedTeardown(Harness* harness) : harness_(harness) {}
  ~ScopedTeardown() {
    int ret = harness_->Teardown();
    if (ret < 0) {
      LOG(ERROR) << "teardown of " << harness_->run_dir()
                 << " failed: " << strerror(-ret);
    }
  }

 private:
  Harness* const harness_;
  DISALLOW_COPY_AND_ASSIGN(ScopedTeardown);
};

std::string FormatOutput(const proto::ScenarioConfig& config,
                         const Verification& v) {
  std::ostringstream oss;
  oss << "scenario:  " << DescribeScenario(config) << "\n";
  oss << "initial:   " << v.initial << "\n";
  oss << "expected:  " << v.expected << "\n";
  oss << "actual:    " << v.actual << "\n";
  if (v.shape == proto::READ_MODIFY_WRITE) {
    oss << "applied:   " << v.succeeded << " of " << v.attempted << "\n";
    oss << "lost:      " << v.lost << "\n";
  } else if (v.shape == proto::BOUNDED_BUFFER) {
    oss << "capacity:  " << v.capacity << "\n";
    oss << "produced:  " << v.produced << "\n";
    oss << "consumed:  " << v.consumed << "\n";
    oss << "rejected:  " << v.rejected << " of " << v.attempted << "\n";
  } else {
    oss << "succeeded: " << v.succeeded << " of " << v.attempted << " ("
        << v.rejected << " rejected)\n";
    oss << "oversold:  " << v.oversold << "\n";
  }
  if (v.failed_workers > 0) {
    oss << "failed:    " << v.failed_workers << " worker(s)\n";
  }
  oss << "verdict:   "
      << (v.race_detected ? "RACE DETECTED" : "no race")
      << (v.inconclusive ? " (inconclusive)" : "");
  return oss.str();
}

std::string FormatMessage(const proto::ScenarioConfig& config,
                          const Verification& v) {
  std::ostringstream oss;
  if (!v.race_detected) {
    oss << config.name() << " = " << v.actual << " as expected";
    if (v.shape == proto::CHECK_THEN_ACT) {
      oss << ": " << v.succeeded << " succeeded, " << v.rejected
          << " rejected";
    } else if (v.shape == proto::BOUNDED_BUFFER) {
      oss << ": " << v.produced << " produced, " << v.consumed
          << " consumed";
    }
  } else if (v.shape == proto::READ_MODIFY_WRITE) {
    oss << "race detected: " << v.lost << " lost to overwritten updates, "
        << config.name() << " = " << v.actual << " instead of "
        << v.expected;
  } else if (!v.invariant_held) {
    oss << "race detected: " << config.name() << " left its bounds ("
        << v.actual << ") after " << v.succeeded << " successful operation(s)";
  } else {
    oss << "race detected: " << config.name() << " = " << v.actual
        << " but " << v.succeeded << " successful operation(s) imply "
        << v.expected;
  }
  return oss.str();
}

}  // namespace

const char* HarnessStateName(HarnessState state) {
  switch (state) {
    case HarnessState::INIT:
      return "INIT";
    case HarnessState::SPAWNED:
      return "SPAWNED";
    case HarnessState::AWAITING_COMPLETION:
      return "AWAITING_COMPLETION";
    case HarnessState::VERIFIED:
      return "VERIFIED";
    case HarnessState::TORN_DOWN:
      return "TORN_DOWN";
    case HarnessState::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

Harness::Harness(const proto::ScenarioConfig& config,
                 const std::string& run_dir,
                 std::unique_ptr<store::ResourceStore> store,
                 std::unique_ptr<Launcher> launcher)
    : config_(config),
      run_dir_(run_dir),
      store_(std::move(store)),
      launcher_(std::move(launcher)) {
  CHECK(store_ != nullptr);
  CHECK(launcher_ != nullptr);
}

Harness::~Harness() {
  if (state_ != HarnessState::TORN_DOWN && Teardown() < 0) {
    LOG(ERROR) << "teardown of " << run_dir_ << " failed";
  }
}

void Harness::Fail(const std::string& why) {
  LOG(ERROR) << config_.name() << " failed in state "
             << HarnessStateName(state_) << ": " << why;
  failure_ = why;
  state_ = HarnessState::FAILED;
}

int Harness::Initialize(int64_t start_value) {
  if (state_ != HarnessState::INIT) {
    LOG(ERROR) << "cannot initialize in state " << HarnessStateName(state_);
    return -EINVAL;
  }
  int ret = util::CreateOrUseDir(run_dir_);
  if (ret < 0) {
    Fail("cannot create run directory " + run_dir_);
    return ret;
  }
  lock::FileMutex(run_dir_, config_.name(), util::ProcessToken(),
                  LockPolicy()).Cleanup();
  ret = store_->Init(config_.name(), start_value);
  if (ret < 0) {
    Fail("cannot initialize " + store_->Describe());
    return ret;
  }
  initialized_ = true;
  VLOG(1) << "initialized " << store_->Describe() << " to " << start_value;
  return 0;
}

lock::RetryPolicy Harness::LockPolicy() const {
  lock::RetryPolicy policy;
  policy.max_attempts = config_.lock_max_attempts();
  policy.retry_delay_ms = config_.lock_retry_delay_ms();
  return policy;
}

WorkerSpec Harness::SpecFor(int index) const {
  WorkerSpec spec;
  spec.worker_id = "worker-" + std::to_string(index + 1);
  spec.repetitions = config_.repetitions();
  spec.amount = config_.amount();
  spec.shape = config_.shape();
  spec.act_policy = config_.act_policy();
  if (config_.shape() == proto::BOUNDED_BUFFER) {
    spec.capacity = config_.capacity();
    spec.role = index < config_.workers() - config_.consumers()
                    ? proto::PRODUCER
                    : proto::CONSUMER;
  }
  spec.synchronized = config_.synchronized();
  spec.delay_min_ms = config_.delay_min_ms();
  spec.delay_max_ms = config_.delay_max_ms();
  spec.pause_max_ms = config_.pause_max_ms();
  spec.store = config_.store();
  spec.resource_path = config_.store() == proto::SQLITE_STORE
                           ? DatabasePath(run_dir_, config_.name())
                           : ResourcePath(run_dir_, config_.name());
  spec.lock_dir = run_dir_;
  spec.lock_name = config_.name();
  spec.lock_max_attempts = config_.lock_max_attempts();
  spec.lock_retry_delay_ms = config_.lock_retry_delay_ms();
  spec.report_path = run_dir_ + "/" + spec.worker_id + ".report";
  return spec;
}

int Harness::Run() {
  if (state_ != HarnessState::INIT || !initialized_) {
    LOG(ERROR) << "cannot run in state " << HarnessStateName(state_)
               << (initialized_ ? "" : " before initialization");
    return -EINVAL;
  }

  int launch_error = 0;
  int launched = 0;
  for (int i = 0; i < config_.workers(); ++i) {
    int ret = launcher_->Launch(SpecFor(i));
    if (ret < 0) {
      launch_error = ret;
      break;
    }
    ++launched;
  }
  state_ = HarnessState::SPAWNED;
  LOG(INFO) << "launched " << launched << " worker(s) for "
            << DescribeScenario(config_) << " as " << launcher_->Describe();

  // Wait even after a launch failure so no worker outlives the run.
  state_ = HarnessState::AWAITING_COMPLETION;
  outcomes_ = launcher_->AwaitAll();

  if (launch_error < 0) {
    Fail("launched only " + std::to_string(launched) + " of " +
         std::to_string(config_.workers()) + " workers");
    return launch_error;
  }
  return 0;
}

int Harness::Verify(Verification* verification) {
  if (state_ != HarnessState::AWAITING_COMPLETION) {
    LOG(ERROR) << "cannot verify in state " << HarnessStateName(state_);
    return -EINVAL;
  }
  proto::ResourceRecord record;
  int ret = store_->Read(&record);
  if (ret < 0) {
    Fail("cannot read final state from " + store_->Describe());
    return ret;
  }
  *verification = VerifyFinalState(config_, record.value(), outcomes_);
  state_ = HarnessState::VERIFIED;
  if (verification->race_detected) {
    LOG(WARNING) << "RACE: " << config_.name() << ": "
                 << verification->Summary();
  } else {
    LOG(INFO) << config_.name() << ": " << verification->Summary();
  }
  return 0;
}

int Harness::Teardown() {
  if (state_ == HarnessState::TORN_DOWN) {
    return 0;
  }
  int ret = store_->Teardown();
  if (ret < 0) {
    LOG(ERROR) << "cannot tear down " << store_->Describe();
  }

  lock::FileMutex lock(run_dir_, config_.name(), util::ProcessToken(),
                       LockPolicy());
  if (lock.IsLocked()) {
    LOG(WARNING) << "removing abandoned lock " << lock.path()
                 << " held by " << lock.Owner();
  }
  lock.Cleanup();

  if (util::FileExists(run_dir_)) {
    int dir_ret = util::DeleteDirRecursively(run_dir_);
    if (dir_ret < 0) {
      LOG(ERROR) << "cannot remove run directory " << run_dir_;
      if (ret == 0) ret = dir_ret;
    }
  }
  VLOG(1) << "tore down " << run_dir_ << " from state "
          << HarnessStateName(state_);
  state_ = HarnessState::TORN_DOWN;
  return ret;
}

RunResult Harness::Execute() {
  RunResult result;
  ScopedTeardown teardown(this);

  int ret = Initialize(config_.initial_value());
  if (ret == 0) ret = Run();
  Verification v;
  if (ret == 0) ret = Verify(&v);
  if (ret < 0) {
    result.message = config_.name() + " did not complete";
    result.error = failure_.empty() ? strerror(-ret) : failure_;
    return result;
  }

  result.verified = true;
  result.verification = v;
  result.output = FormatOutput(config_, v);
  result.message = FormatMessage(config_, v);
  if (v.failed_workers > 0 || v.inconclusive) {
    result.error = std::to_string(v.failed_workers) + " worker(s) failed" +
        (v.inconclusive ? "; result is inconclusive" : "");
  } else if (config_.synchronized() && v.race_detected) {
    result.error = "locked run did not preserve " + config_.name();
  } else {
    result.success = true;
  }
  return result;
}

RunResult RunScenario(const proto::ScenarioConfig& config) {
  std::string why;
  if (!ValidateScenario(config, &why)) {
    RunResult result;
    result.message = "invalid scenario " + config.name();
    result.error = why;
    return result;
  }

  static std::atomic<int> runs(0);
  std::string run_dir = config.work_dir() + "/racelab-" + config.name() +
      "-" + std::to_string(getpid()) + "-" + std::to_string(runs++);

  std::unique_ptr<Launcher> launcher;
  if (config.launcher() == proto::THREAD) {
    launcher.reset(new ThreadLauncher());
  } else {
    launcher.reset(new ProcessLauncher(config.worker_binary(),
                                       config.worker_timeout_ms()));
  }
  std::unique_ptr<store::ResourceStore> store;
  if (config.store() == proto::SQLITE_STORE) {
    store = store::NewSqliteResourceStore(
        Harness::DatabasePath(run_dir, config.name()),
        BusyTimeoutMs(config.lock_max_attempts(),
                      config.lock_retry_delay_ms()));
  } else {
    store = store::NewFileResourceStore(
        Harness::ResourcePath(run_dir, config.name()));
  }
  Harness harness(config, run_dir, std::move(store), std::move(launcher));
  return harness.Execute();
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
