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
// Launchers start workers as independently scheduled units and wait for all
// of them.  Workers never talk to the launcher while running; what they did
// comes back through their exit status and their WorkerReport.

#pragma once

#include <sys/types.h>

#include <future>
#include <string>
#include <vector>

#include "harness/Worker.h"
#include "util/common.h"

namespace racelab {
namespace harness {

class Launcher {
 public:
  virtual ~Launcher() {}

  /**
   * Start one worker.  Does not wait for it.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  virtual int Launch(const WorkerSpec& spec) = 0;

  // Wait until every launched worker has finished.  Outcomes are in launch
  // order.
  virtual std::vector<WorkerOutcome> AwaitAll() = 0;

  virtual std::string Describe() const = 0;
};

// Runs each worker in its own process.  Processes share nothing but the
// resource file and the lock marker.
class ProcessLauncher : public Launcher {
 public:
  /**
   * @param worker_binary if not empty, the child execs this racelab_worker
   * executable; otherwise the forked child runs the worker directly.
   * @param timeout_ms kill workers still running this long after AwaitAll()
   * started; 0 waits forever.
   */
  ProcessLauncher(const std::string& worker_binary, int timeout_ms);
  ~ProcessLauncher();

  int Launch(const WorkerSpec& spec) override;
  std::vector<WorkerOutcome> AwaitAll() override;
  std::string Describe() const override;

  // Command line of racelab_worker for "spec", without the binary itself.
  static std::vector<std::string> WorkerArgs(const WorkerSpec& spec);

 private:
  struct Child {
    pid_t pid;
    WorkerSpec spec;
  };

  // Reap "child", killing it once "deadline_us" has passed (if not 0).
  void Reap(const Child& child, uint64_t deadline_us, WorkerOutcome* outcome);

  const std::string worker_binary_;
  const int timeout_ms_;
  std::vector<Child> children_;

  DISALLOW_COPY_AND_ASSIGN(ProcessLauncher);
};

// Runs each worker on its own thread of the calling process.  Workers still
// coordinate only through the resource file and the lock marker, each with
// its own lock token.
class ThreadLauncher : public Launcher {
 public:
  ThreadLauncher() {}

  int Launch(const WorkerSpec& spec) override;
  std::vector<WorkerOutcome> AwaitAll() override;
  std::string Describe() const override { return "threads"; }

 private:
  std::vector<std::future<WorkerOutcome>> futures_;

  DISALLOW_COPY_AND_ASSIGN(ThreadLauncher);
};

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
