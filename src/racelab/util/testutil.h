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
// Helpers shared by the unit tests.

#pragma once

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/filesystem.hpp>

#include <functional>
#include <list>
#include <string>
#include <thread>
#include <vector>

namespace racelab {
namespace util {
namespace test {

// Return the path of a fresh, empty directory under /tmp.
inline std::string NewTestDir(const std::string& prefix) {
  boost::filesystem::path dir = boost::filesystem::temp_directory_path() /
      boost::filesystem::unique_path(prefix + "-%%%%-%%%%-%%%%");
  boost::filesystem::create_directories(dir);
  return dir.string();
}

inline void DoParallel(int nthread, std::function<void(int)> worker) {
  std::list<std::thread> threads;
  for (int i = 0; i < nthread; ++i) {
    threads.emplace_back(worker, i);
  }
  for (auto it = threads.begin(); it != threads.end(); ++it) {
    it->join();
  }
}

// Run "child" in "nproc" forked processes and return their exit statuses.
// "child" receives the index of the process and returns its exit status.
inline std::vector<int> ForkAndWait(int nproc, std::function<int(int)> child) {
  std::vector<pid_t> pids;
  for (int i = 0; i < nproc; ++i) {
    pid_t pid = fork();
    if (pid == 0) {
      _exit(child(i));
    }
    pids.push_back(pid);
  }
  std::vector<int> statuses;
  for (pid_t pid : pids) {
    int status = 0;
    if (pid < 0 || waitpid(pid, &status, 0) != pid) {
      statuses.push_back(-1);
    } else {
      statuses.push_back(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
    }
  }
  return statuses;
}

}  // namespace test
}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
