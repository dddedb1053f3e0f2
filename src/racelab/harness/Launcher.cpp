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
#include "harness/Launcher.h"

#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include <chrono>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "util/fileutil.h"
#include "util/protobuf.h"

namespace racelab {
namespace harness {

static const int kReapPollMs = 5;

ProcessLauncher::ProcessLauncher(const std::string& worker_binary,
                                 int timeout_ms)
    : worker_binary_(worker_binary), timeout_ms_(timeout_ms) {
  CHECK_GE(timeout_ms_, 0);
}

ProcessLauncher::~ProcessLauncher() {
  for (const Child& child : children_) {
    LOG(WARNING) << "killing unreaped worker " << child.spec.worker_id
                 << " (pid " << child.pid << ")";
    kill(child.pid, SIGKILL);
    waitpid(child.pid, nullptr, 0);
  }
}

std::string ProcessLauncher::Describe() const {
  if (worker_binary_.empty()) return "processes";
  return "processes (" + worker_binary_ + ")";
}

std::vector<std::string> ProcessLauncher::WorkerArgs(const WorkerSpec& spec) {
  std::vector<std::string> args;
  args.push_back("--worker_id=" + spec.worker_id);
  args.push_back("--repetitions=" + std::to_string(spec.repetitions));
  args.push_back("--amount=" + std::to_string(spec.amount));
  args.push_back("--shape=" + proto::OperationShape_Name(spec.shape));
  args.push_back("--act_policy=" + proto::ActPolicy_Name(spec.act_policy));
  if (spec.shape == proto::BOUNDED_BUFFER) {
    args.push_back("--role=" + proto::WorkerRole_Name(spec.role));
    args.push_back("--capacity=" + std::to_string(spec.capacity));
  }
  args.push_back(std::string("--synchronized=") +
                 (spec.synchronized ? "true" : "false"));
  args.push_back("--delay_min_ms=" + std::to_string(spec.delay_min_ms));
  args.push_back("--delay_max_ms=" + std::to_string(spec.delay_max_ms));
  args.push_back("--pause_max_ms=" + std::to_string(spec.pause_max_ms));
  args.push_back("--store=" + proto::StoreKind_Name(spec.store));
  args.push_back("--resource_path=" + spec.resource_path);
  args.push_back("--lock_dir=" + spec.lock_dir);
  args.push_back("--lock_name=" + spec.lock_name);
  if (!spec.lock_owner.empty()) {
    args.push_back("--lock_owner=" + spec.lock_owner);
  }
  args.push_back("--lock_max_attempts=" +
                 std::to_string(spec.lock_max_attempts));
  args.push_back("--lock_retry_delay_ms=" +
                 std::to_string(spec.lock_retry_delay_ms));
  args.push_back("--report_path=" + spec.report_path);
  return args;
}

int ProcessLauncher::Launch(const WorkerSpec& spec) {
  if (!spec.report_path.empty()) {
    int ret = util::DeleteFile(spec.report_path);
    if (ret < 0 && ret != -ENOENT) {
      LOG(ERROR) << "cannot remove stale report " << spec.report_path;
      return ret;
    }
  }
  // Buffered output would otherwise be written once more by the child.
  fflush(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    PLOG(ERROR) << "cannot fork worker " << spec.worker_id;
    return -err;
  }

  if (pid == 0) {
    if (worker_binary_.empty()) {
      proto::WorkerReport report;
      _exit(RunWorker(spec, &report));
    }
    std::vector<std::string> args = WorkerArgs(spec);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(worker_binary_.c_str()));
    for (std::string& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    execv(worker_binary_.c_str(), argv.data());
    PLOG(ERROR) << "cannot exec " << worker_binary_;
    _exit(127);
  }

  VLOG(1) << "launched worker " << spec.worker_id << " as pid " << pid;
  Child child;
  child.pid = pid;
  child.spec = spec;
  children_.push_back(child);
  return 0;
}

void ProcessLauncher::Reap(const Child& child, uint64_t deadline_us,
                           WorkerOutcome* outcome) {
  int status = 0;
  while (true) {
    pid_t ret = waitpid(child.pid, &status, deadline_us == 0 ? 0 : WNOHANG);
    if (ret == child.pid) {
      break;
    }
    if (ret < 0) {
      if (errno == EINTR) continue;
      PLOG(ERROR) << "cannot wait for worker " << child.spec.worker_id;
      return;
    }
    if (util::NowMicros() >= deadline_us) {
      LOG(ERROR) << "worker " << child.spec.worker_id << " (pid " << child.pid
                 << ") timed out after " << timeout_ms_ << "ms; killing it";
      kill(child.pid, SIGKILL);
      outcome->timed_out = true;
      deadline_us = 0;
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMs));
  }

  if (WIFEXITED(status)) {
    outcome->exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome->term_signal = WTERMSIG(status);
  }
}

std::vector<WorkerOutcome> ProcessLauncher::AwaitAll() {
  uint64_t deadline_us = 0;
  if (timeout_ms_ > 0) {
    deadline_us = util::NowMicros() + timeout_ms_ * 1000ULL;
  }

  std::vector<WorkerOutcome> outcomes;
  for (const Child& child : children_) {
    WorkerOutcome outcome;
    outcome.worker_id = child.spec.worker_id;
    Reap(child, deadline_us, &outcome);

    const std::string& report_path = child.spec.report_path;
    if (!report_path.empty()) {
      if (util::ReadMessageFromFile(report_path, &outcome.report) >= 0) {
        outcome.has_report = true;
        if (util::DeleteFile(report_path) < 0) {
          LOG(WARNING) << "cannot remove report " << report_path;
        }
      } else {
        LOG(WARNING) << "worker " << outcome.worker_id << " left no report";
      }
    }
    if (!outcome.ok()) {
      LOG(ERROR) << "worker " << outcome.worker_id << " failed: status "
                 << outcome.exit_status << ", signal " << outcome.term_signal;
    }
    outcomes.push_back(outcome);
  }
  children_.clear();
  return outcomes;
}

int ThreadLauncher::Launch(const WorkerSpec& spec) {
  WorkerSpec thread_spec = spec;
  if (thread_spec.lock_owner.empty()) {
    thread_spec.lock_owner = util::WorkerToken(spec.worker_id);
  }
  // The report comes back through the future.
  thread_spec.report_path.clear();
  try {
    futures_.push_back(std::async(std::launch::async, [thread_spec]() {
      WorkerOutcome outcome;
      outcome.worker_id = thread_spec.worker_id;
      outcome.exit_status = RunWorker(thread_spec, &outcome.report);
      outcome.has_report = true;
      return outcome;
    }));
  } catch (const std::system_error& e) {
    LOG(ERROR) << "cannot start thread for worker " << spec.worker_id << ": "
               << e.what();
    return -EAGAIN;
  }
  return 0;
}

std::vector<WorkerOutcome> ThreadLauncher::AwaitAll() {
  std::vector<WorkerOutcome> outcomes;
  for (auto& future : futures_) {
    outcomes.push_back(future.get());
    if (!outcomes.back().ok()) {
      LOG(ERROR) << "worker " << outcomes.back().worker_id
                 << " failed: status " << outcomes.back().exit_status;
    }
  }
  futures_.clear();
  return outcomes;
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
