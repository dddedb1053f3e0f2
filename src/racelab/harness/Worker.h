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
// A Worker performs repeated cycles of contended work on a ResourceStore.
//
// Three cycle shapes are supported:
//
//   READ_MODIFY_WRITE:  v = read(); delay(); write(v + amount)
//   CHECK_THEN_ACT:     v = read(); if (v >= amount) { delay(); act(); }
//                       else reject
//   BOUNDED_BUFFER:     a producer checks v + amount <= capacity and acts
//                       with +amount, a consumer checks v >= amount and acts
//                       with -amount
//
// where act() applies the change to the current value (ACT_ON_CURRENT_VALUE,
// like a real debit) or to the checked value "v" (ACT_ON_CHECKED_VALUE).  An
// unsynchronized worker runs the cycle as separate unprotected steps.  A
// synchronized worker runs the whole cycle while holding the resource's
// FileMutex, or inside one transaction if the store is transactional.

#pragma once

#include <stdint.h>

#include <string>

#include "harness/Delay.h"
#include "lock/FileMutex.h"
#include "proto/Racelab.pb.h"
#include "store/ResourceStore.h"
#include "util/common.h"

namespace racelab {
namespace harness {

// Exit status of a worker process.
enum WorkerExitStatus {
  kWorkerOk = 0,
  kWorkerStoreError = 1,
  kWorkerLockExhausted = 2,
};

// Everything a worker needs, including in a freshly exec'ed process.
struct WorkerSpec {
  std::string worker_id;
  int repetitions = 1;
  int64_t amount = 1;
  proto::OperationShape shape = proto::READ_MODIFY_WRITE;
  proto::ActPolicy act_policy = proto::ACT_ON_CURRENT_VALUE;
  proto::WorkerRole role = proto::PRODUCER;
  // Upper bound of a BOUNDED_BUFFER.
  int64_t capacity = 0;
  bool synchronized = false;

  int delay_min_ms = 0;
  int delay_max_ms = 0;
  int pause_max_ms = 0;

  proto::StoreKind store = proto::FILE_STORE;
  std::string resource_path;
  std::string lock_dir;
  std::string lock_name;
  // Token written into the lock marker.  Empty means the process id.
  std::string lock_owner;
  int lock_max_attempts = 100;
  int lock_retry_delay_ms = 10;

  // Where a worker process leaves its WorkerReport.  May be empty.
  std::string report_path;
};

// What the harness learned about one worker after it finished.
struct WorkerOutcome {
  std::string worker_id;
  // Exit status, or -1 if the worker did not exit normally.
  int exit_status = -1;
  // Signal that terminated a worker process, 0 if none.
  int term_signal = 0;
  bool timed_out = false;
  bool has_report = false;
  proto::WorkerReport report;

  bool ok() const { return exit_status == kWorkerOk && !timed_out; }
};

class Worker {
 public:
  // "mutex" may be null unless the spec is synchronized and the store is not
  // transactional.  The worker does not own any of the pointers.
  Worker(const WorkerSpec& spec, store::ResourceStore* store,
         lock::FileMutex* mutex, Delay* window, Delay* pause);

  /**
   * Run all repetitions.  Stops early if the lock cannot be acquired or the
   * store fails.
   *
   * @return a WorkerExitStatus.
   */
  int Run();

  const proto::WorkerReport& report() const { return report_; }

 private:
  enum class Outcome { APPLIED, REJECTED, LOCK_FAILED, STORE_FAILED };

  Outcome RunOnce();
  Outcome RunCycle();
  Outcome RunTransaction();
  Outcome ReadModifyWrite();
  // Applies "change" if the value stays within bounds after it.
  Outcome CheckThenAct(int64_t change);
  Outcome WriteValue(proto::ResourceRecord* record, int64_t value);

  // Whether "value" is a legal state of a check-then-act resource.
  bool InBounds(int64_t value) const;

  const WorkerSpec spec_;
  store::ResourceStore* const store_;
  lock::FileMutex* const mutex_;
  Delay* const window_;
  Delay* const pause_;
  proto::WorkerReport report_;

  DISALLOW_COPY_AND_ASSIGN(Worker);
};

/**
 * Run a worker described by "spec" against the file or database store at
 * spec.resource_path, with random delays, and write its report to
 * spec.report_path if set.
 *
 * @return a WorkerExitStatus.
 */
int RunWorker(const WorkerSpec& spec, proto::WorkerReport* report);

// How long a database worker waits for the database, derived from its lock
// retry policy.
int BusyTimeoutMs(int lock_max_attempts, int lock_retry_delay_ms);

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
