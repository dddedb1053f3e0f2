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
// A FileMutex is a named lock shared by independent processes on one host.
// Holding the lock means owning the marker file "<dir>/<name>.lock", which is
// created with open(O_CREAT | O_EXCL); the kernel guarantees that at most one
// creator succeeds.  The marker contains the owner token and nothing else.
//
// Limitations:
// - An owner that dies without calling Release() leaves the marker behind and
//   the lock stays held until somebody calls Cleanup().  There is no lease and
//   no deadlock detection.
// - Waiters spin with a fixed delay.  There is no FIFO order among them.
// - Only works on a local filesystem of a single host.

#pragma once

#include <gflags/gflags.h>

#include <string>

#include "util/common.h"

DECLARE_int32(lock_max_attempts);
DECLARE_int32(lock_retry_delay_ms);

namespace racelab {
namespace lock {

struct RetryPolicy {
  int max_attempts;
  int retry_delay_ms;

  // Built from --lock_max_attempts and --lock_retry_delay_ms.
  static RetryPolicy FromFlags();
};

// FileMutex is NOT thread-safe: each thread or process needs its own instance
// with its own owner token.
class FileMutex {
 public:
  FileMutex(const std::string& dir, const std::string& name,
            const std::string& owner, const RetryPolicy& policy);
  // Owned by the calling process, retry policy from flags.
  FileMutex(const std::string& dir, const std::string& name);

  /**
   * Try to create the marker up to max_attempts times, sleeping
   * retry_delay_ms between two attempts.
   *
   * @return true if the lock is now held by this owner; false if the attempts
   * are exhausted or the marker cannot be created at all.  A false return must
   * never be treated as holding the lock.
   */
  bool Acquire();

  // Single attempt, no sleeping.
  bool TryAcquire();

  /**
   * Delete the marker if and only if it carries this owner's token.  A missing
   * marker or one owned by somebody else is left alone.
   */
  void Release();

  // Delete the marker whoever owns it.  For teardown only.
  void Cleanup();

  bool IsLocked() const;

  // Token stored in the marker, or empty if the lock is free.
  std::string Owner() const;

  const std::string& path() const { return path_; }
  const std::string& owner() const { return owner_; }
  const std::string& name() const { return name_; }
  int attempts() const { return attempts_; }

  static std::string LockPath(const std::string& dir, const std::string& name) {
    return dir + "/" + name + ".lock";
  }

 private:
  // 0 if created, -EEXIST if held by anybody, other negative errno on error.
  int CreateMarker();

  const std::string name_;
  const std::string path_;
  const std::string owner_;
  const RetryPolicy policy_;

  // Attempts used by the last Acquire().
  int attempts_ = 0;

  DISALLOW_COPY_AND_ASSIGN(FileMutex);
};

// Releases an acquired FileMutex when going out of scope.
class FileMutexReleaser {
 public:
  explicit FileMutexReleaser(FileMutex* mutex) : mutex_(mutex) {}
  ~FileMutexReleaser() {
    if (mutex_ != nullptr) mutex_->Release();
  }

 private:
  FileMutex* const mutex_;
  DISALLOW_COPY_AND_ASSIGN(FileMutexReleaser);
};

}  // namespace lock
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
