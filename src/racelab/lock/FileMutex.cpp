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
#include "lock/FileMutex.h"

#include <errno.h>
#include <string.h>

#include <glog/logging.h>

#include <chrono>
#include <string>
#include <thread>

#include "util/fileutil.h"

DEFINE_int32(lock_max_attempts, 100,
             "number of attempts to create a lock marker before giving up");
DEFINE_int32(lock_retry_delay_ms, 10,
             "sleep time between two attempts to create a lock marker");

namespace racelab {
namespace lock {

RetryPolicy RetryPolicy::FromFlags() {
  RetryPolicy policy;
  policy.max_attempts = FLAGS_lock_max_attempts;
  policy.retry_delay_ms = FLAGS_lock_retry_delay_ms;
  return policy;
}

FileMutex::FileMutex(const std::string& dir, const std::string& name,
                     const std::string& owner, const RetryPolicy& policy)
    : name_(name),
      path_(LockPath(dir, name)),
      owner_(owner),
      policy_(policy) {
  CHECK(!owner_.empty()) << "lock " << name_ << " needs an owner token";
  CHECK_GT(policy_.max_attempts, 0);
  CHECK_GE(policy_.retry_delay_ms, 0);
}

FileMutex::FileMutex(const std::string& dir, const std::string& name)
    : FileMutex(dir, name, util::ProcessToken(), RetryPolicy::FromFlags()) {}

int FileMutex::CreateMarker() {
  return util::CreateFileExclusive(path_, owner_);
}

bool FileMutex::Acquire() {
  for (attempts_ = 1; attempts_ <= policy_.max_attempts; ++attempts_) {
    int ret = CreateMarker();
    if (ret == 0) {
      VLOG(3) << owner_ << " acquired " << name_ << " after " << attempts_
              << " attempt(s)";
      return true;
    }
    if (ret != -EEXIST) {
      LOG(ERROR) << owner_ << " cannot create lock marker " << path_ << ": "
                 << strerror(-ret);
      return false;
    }
    if (attempts_ < policy_.max_attempts) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(policy_.retry_delay_ms));
    }
  }
  attempts_ = policy_.max_attempts;
  LOG(WARNING) << owner_ << " gave up on lock " << name_ << " after "
               << policy_.max_attempts << " attempts";
  return false;
}

bool FileMutex::TryAcquire() {
  attempts_ = 1;
  int ret = CreateMarker();
  if (ret != 0 && ret != -EEXIST) {
    LOG(ERROR) << owner_ << " cannot create lock marker " << path_ << ": "
               << strerror(-ret);
  }
  return ret == 0;
}

void FileMutex::Release() {
  std::string token;
  if (util::ReadFromFile(path_, &token) < 0) {
    VLOG(3) << "nothing to release at " << path_;
    return;
  }
  if (token != owner_) {
    // Acquired by somebody else after our own attempt failed.
    VLOG(1) << owner_ << " does not own " << name_ << " (held by " << token
            << "); not releasing";
    return;
  }
  int ret = util::DeleteFile(path_);
  if (ret < 0 && ret != -ENOENT) {
    LOG(ERROR) << "cannot delete lock marker " << path_ << ": "
               << strerror(-ret);
  }
}

void FileMutex::Cleanup() {
  int ret = util::DeleteFile(path_);
  if (ret < 0 && ret != -ENOENT) {
    LOG(ERROR) << "cannot clean up lock marker " << path_ << ": "
               << strerror(-ret);
  }
}

bool FileMutex::IsLocked() const {
  return util::FileExists(path_);
}

std::string FileMutex::Owner() const {
  std::string token;
  if (util::ReadFromFile(path_, &token) < 0) {
    token.clear();
  }
  return token;
}

}  // namespace lock
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
