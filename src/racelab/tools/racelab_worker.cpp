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
// racelab_worker runs one worker against a resource file and exits with
//
//   0  all repetitions done
//   1  the resource could not be read or written
//   2  the lock (or the database) could not be acquired
//   64 bad command line (EX_USAGE)
//
// It is normally started by the racelab harness, but can be run by hand
// against the files of a run directory.

#include <sysexits.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <string>

#include "harness/Worker.h"
#include "lock/FileMutex.h"
#include "proto/Racelab.pb.h"

DEFINE_string(worker_id, "worker", "name of this worker in logs and reports");
DEFINE_int32(repetitions, 1, "number of operations to perform");
DEFINE_int64(amount, 1, "increment or withdrawal per operation");
DEFINE_string(shape, "READ_MODIFY_WRITE",
              "READ_MODIFY_WRITE, CHECK_THEN_ACT or BOUNDED_BUFFER");
DEFINE_string(act_policy, "ACT_ON_CURRENT_VALUE",
              "ACT_ON_CURRENT_VALUE or ACT_ON_CHECKED_VALUE");
DEFINE_string(role, "PRODUCER", "PRODUCER or CONSUMER, for BOUNDED_BUFFER");
DEFINE_int64(capacity, 0, "capacity of a BOUNDED_BUFFER");
DEFINE_bool(synchronized, false, "hold the lock during each operation");
DEFINE_int32(delay_min_ms, 0, "lower bound of the read-to-write delay");
DEFINE_int32(delay_max_ms, 10, "upper bound of the read-to-write delay");
DEFINE_int32(pause_max_ms, 5, "upper bound of the pause before an operation");
DEFINE_string(store, "FILE_STORE", "FILE_STORE or SQLITE_STORE");
DEFINE_string(resource_path, "", "resource file or database to operate on");
DEFINE_string(lock_dir, "", "directory of the lock marker");
DEFINE_string(lock_name, "", "name of the lock");
DEFINE_string(lock_owner, "", "lock token; defaults to the process id");
DEFINE_string(report_path, "", "where to leave the worker report");

using racelab::harness::RunWorker;
using racelab::harness::WorkerSpec;

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("racelab_worker --resource_path=<file> [options]");
  FLAGS_logtostderr = true;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_resource_path.empty()) {
    LOG(ERROR) << "--resource_path is required";
    return EX_USAGE;
  }

  WorkerSpec spec;
  spec.worker_id = FLAGS_worker_id;
  spec.repetitions = FLAGS_repetitions;
  spec.amount = FLAGS_amount;
  if (!racelab::proto::OperationShape_Parse(FLAGS_shape, &spec.shape)) {
    LOG(ERROR) << "unknown --shape " << FLAGS_shape;
    return EX_USAGE;
  }
  if (!racelab::proto::ActPolicy_Parse(FLAGS_act_policy, &spec.act_policy)) {
    LOG(ERROR) << "unknown --act_policy " << FLAGS_act_policy;
    return EX_USAGE;
  }
  if (!racelab::proto::WorkerRole_Parse(FLAGS_role, &spec.role)) {
    LOG(ERROR) << "unknown --role " << FLAGS_role;
    return EX_USAGE;
  }
  spec.capacity = FLAGS_capacity;
  if (!racelab::proto::StoreKind_Parse(FLAGS_store, &spec.store)) {
    LOG(ERROR) << "unknown --store " << FLAGS_store;
    return EX_USAGE;
  }
  spec.synchronized = FLAGS_synchronized;
  spec.delay_min_ms = FLAGS_delay_min_ms;
  spec.delay_max_ms = FLAGS_delay_max_ms;
  spec.pause_max_ms = FLAGS_pause_max_ms;
  spec.resource_path = FLAGS_resource_path;
  spec.lock_dir = FLAGS_lock_dir;
  spec.lock_name = FLAGS_lock_name;
  spec.lock_owner = FLAGS_lock_owner;
  spec.lock_max_attempts = FLAGS_lock_max_attempts;
  spec.lock_retry_delay_ms = FLAGS_lock_retry_delay_ms;
  spec.report_path = FLAGS_report_path;

  if (spec.synchronized && spec.store == racelab::proto::FILE_STORE &&
      (spec.lock_dir.empty() || spec.lock_name.empty())) {
    LOG(ERROR) << "--synchronized needs --lock_dir and --lock_name";
    return EX_USAGE;
  }
  if (spec.repetitions < 0 || spec.amount <= 0 || spec.delay_min_ms < 0 ||
      spec.delay_min_ms > spec.delay_max_ms || spec.pause_max_ms < 0 ||
      spec.lock_max_attempts < 1 || spec.lock_retry_delay_ms < 0 ||
      (spec.shape == racelab::proto::BOUNDED_BUFFER && spec.capacity <= 0)) {
    LOG(ERROR) << "bad worker parameters";
    return EX_USAGE;
  }

  racelab::proto::WorkerReport report;
  return RunWorker(spec, &report);
}

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
