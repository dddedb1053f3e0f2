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
#include "harness/Worker.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <glog/logging.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

#include "util/protobuf.h"

using racelab::lock::FileMutex;
using racelab::lock::FileMutexReleaser;
using racelab::proto::ResourceRecord;

namespace racelab {
namespace harness {

Worker::Worker(const WorkerSpec& spec, store::ResourceStore* store,
               FileMutex* mutex, Delay* window, Delay* pause)
    : spec_(spec), store_(store), mutex_(mutex), window_(window),
      pause_(pause) {
  CHECK(store_ != nullptr);
  CHECK(window_ != nullptr);
  CHECK(pause_ != nullptr);
  CHECK(!spec_.synchronized || mutex_ != nullptr || store_->Transactional())
      << "synchronized worker " << spec_.worker_id << " needs a lock";
  CHECK_GE(spec_.repetitions, 0);
  CHECK_GT(spec_.amount, 0);
  CHECK(spec_.shape != proto::BOUNDED_BUFFER || spec_.capacity > 0);
  report_.set_worker_id(spec_.worker_id);
  report_.set_pid(getpid());
  report_.set_amount(spec_.amount);
  report_.set_role(spec_.role);
  report_.set_attempted(0);
  report_.set_applied(0);
  report_.set_rejected(0);
  report_.set_lock_failures(0);
  report_.set_errors(0);
}

int Worker::Run() {
  VLOG(1) << spec_.worker_id << " started: " << spec_.repetitions
          << " repetition(s) of " << spec_.amount
          << (spec_.synchronized ? " (locked)" : " (unsynchronized)");
  int status = kWorkerOk;
  for (int i = 0; i < spec_.repetitions && status == kWorkerOk; ++i) {
    pause_->Wait();
    report_.set_attempted(report_.attempted() + 1);
    switch (RunOnce()) {
      case Outcome::APPLIED:
        report_.set_applied(report_.applied() + 1);
        break;
      case Outcome::REJECTED:
        report_.set_rejected(report_.rejected() + 1);
        break;
      case Outcome::LOCK_FAILED:
        report_.set_lock_failures(report_.lock_failures() + 1);
        status = kWorkerLockExhausted;
        break;
      case Outcome::STORE_FAILED:
        report_.set_errors(report_.errors() + 1);
        status = kWorkerStoreError;
        break;
    }
  }
  if (status == kWorkerOk) {
    LOG(INFO) << spec_.worker_id << " completed: " << report_.applied()
              << " applied, " << report_.rejected() << " rejected";
  } else {
    LOG(ERROR) << spec_.worker_id << " stopped after " << report_.attempted()
               << " of " << spec_.repetitions << " repetition(s)";
  }
  return status;
}

Worker::Outcome Worker::RunOnce() {
  if (!spec_.synchronized) {
    return RunCycle();
  }
  if (store_->Transactional()) {
    return RunTransaction();
  }
  if (!mutex_->Acquire()) {
    LOG(ERROR) << spec_.worker_id << " failed to acquire " << mutex_->name();
    return Outcome::LOCK_FAILED;
  }
  FileMutexReleaser releaser(mutex_);
  return RunCycle();
}

Worker::Outcome Worker::RunCycle() {
  switch (spec_.shape) {
    case proto::CHECK_THEN_ACT:
      return CheckThenAct(-spec_.amount);
    case proto::BOUNDED_BUFFER:
      return CheckThenAct(spec_.role == proto::CONSUMER ? -spec_.amount
                                                        : spec_.amount);
    default:
      return ReadModifyWrite();
  }
}

// BEGIN comes before every read and write of the cycle.  Only an applied
// operation is committed; a rejection or a failure rolls everything back.
Worker::Outcome Worker::RunTransaction() {
  int ret = store_->Begin();
  if (ret == -EBUSY) {
    LOG(ERROR) << spec_.worker_id << " gave up waiting for "
               << store_->Describe();
    return Outcome::LOCK_FAILED;
  }
  if (ret < 0) {
    return Outcome::STORE_FAILED;
  }

  Outcome outcome = RunCycle();
  if (outcome == Outcome::APPLIED) {
    if (store_->Commit() == 0) {
      return outcome;
    }
    LOG(ERROR) << spec_.worker_id << " cannot commit to "
               << store_->Describe();
    outcome = Outcome::STORE_FAILED;
  }
  if (store_->Rollback() < 0) {
    LOG(ERROR) << spec_.worker_id << " cannot roll back "
               << store_->Describe();
  } else {
    VLOG(1) << spec_.worker_id << " rolled back";
  }
  return outcome;
}

Worker::Outcome Worker::ReadModifyWrite() {
  ResourceRecord record;
  if (store_->Read(&record) != 0) {
    return Outcome::STORE_FAILED;
  }
  int64_t seen = record.value();
  window_->Wait();
  return WriteValue(&record, seen + spec_.amount);
}

bool Worker::InBounds(int64_t value) const {
  return value >= 0 &&
         (spec_.shape != proto::BOUNDED_BUFFER || value <= spec_.capacity);
}

Worker::Outcome Worker::CheckThenAct(int64_t change) {
  ResourceRecord record;
  if (store_->Read(&record) != 0) {
    return Outcome::STORE_FAILED;
  }
  int64_t checked = record.value();
  if (!InBounds(checked + change)) {
    VLOG(1) << spec_.worker_id << " rejected: " << record.name() << " is "
            << checked << ", cannot apply " << change;
    return Outcome::REJECTED;
  }
  window_->Wait();
  if (spec_.act_policy == proto::ACT_ON_CURRENT_VALUE &&
      store_->Read(&record) != 0) {
    return Outcome::STORE_FAILED;
  }
  int64_t result = record.value() + change;
  if (!InBounds(result)) {
    LOG(WARNING) << "RACE: " << spec_.worker_id << " passed the check at "
                 << checked << " but drove " << record.name() << " to "
                 << result;
  }
  if (spec_.shape == proto::BOUNDED_BUFFER) {
    if (change > 0) {
      record.set_produced(record.produced() + change);
    } else {
      record.set_consumed(record.consumed() - change);
    }
  }
  return WriteValue(&record, result);
}

Worker::Outcome Worker::WriteValue(ResourceRecord* record, int64_t value) {
  VLOG(2) << spec_.worker_id << ": " << record->name() << " "
          << record->value() << " -> " << value;
  record->set_value(value);
  record->set_version(record->version() + 1);
  record->set_last_writer(spec_.worker_id);
  if (store_->Write(*record) != 0) {
    return Outcome::STORE_FAILED;
  }
  return Outcome::APPLIED;
}

int BusyTimeoutMs(int lock_max_attempts, int lock_retry_delay_ms) {
  int64_t ms = static_cast<int64_t>(lock_max_attempts) *
               std::max(lock_retry_delay_ms, 1);
  return static_cast<int>(
      std::min<int64_t>(ms, std::numeric_limits<int>::max()));
}

int RunWorker(const WorkerSpec& spec, proto::WorkerReport* report) {
  std::unique_ptr<store::ResourceStore> store;
  if (spec.store == proto::SQLITE_STORE) {
    store = store::NewSqliteResourceStore(
        spec.resource_path,
        BusyTimeoutMs(spec.lock_max_attempts, spec.lock_retry_delay_ms));
  } else {
    store = store::NewFileResourceStore(spec.resource_path);
  }

  std::unique_ptr<FileMutex> mutex;
  if (spec.synchronized && !store->Transactional()) {
    lock::RetryPolicy policy;
    policy.max_attempts = spec.lock_max_attempts;
    policy.retry_delay_ms = spec.lock_retry_delay_ms;
    std::string owner =
        spec.lock_owner.empty() ? util::ProcessToken() : spec.lock_owner;
    mutex.reset(new FileMutex(spec.lock_dir, spec.lock_name, owner, policy));
  }

  RandomDelay window(spec.delay_min_ms, spec.delay_max_ms, FreshSeed());
  RandomDelay pause(0, spec.pause_max_ms, FreshSeed());

  Worker worker(spec, store.get(), mutex.get(), &window, &pause);
  int status = worker.Run();
  *report = worker.report();

  if (!spec.report_path.empty()) {
    ssize_t ret = util::WriteMessageToFile(*report, spec.report_path);
    if (ret < 0) {
      LOG(ERROR) << spec.worker_id << " cannot write report to "
                 << spec.report_path << ": " << strerror(-ret);
    }
  }
  return status;
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
