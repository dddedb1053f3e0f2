// Copyright (C) 2013-2018 Ming Chen
// Copyright (C) 2016-2016 Praveen Kumar Morampudi
// Copyright (C) 2016-2016 Harshkumar Patel
// Copyright (C) 2017-2017 Rushabh Shah
// Copyright (C) 2013-2014 Arun Olappamanna Vasudevan
// Copyright (C) 2013-2014 Kelong Wang
// Copyright (C) 2013-2018 Erez Zadok
// Copyright (c) 2013-2018 Stony Brook University
// Copyright (c) 2013-2018 The Research Foundation for SUNY
//
//
// A std::mutex carrying clang thread-safety annotations, so that
// -Wthread-safety can check GUARDED_BY members of in-process state such as
// MemoryResourceStore.  Cross-process exclusion is lock/FileMutex.h.

#pragma once

#include <mutex>

#if defined(__clang__)
#define RACELAB_THREAD_ANNOTATION(x) __attribute__((x))
#else
#define RACELAB_THREAD_ANNOTATION(x)
#endif

#define CAPABILITY(x) RACELAB_THREAD_ANNOTATION(capability(x))
#define SCOPED_CAPABILITY RACELAB_THREAD_ANNOTATION(scoped_lockable)
#define GUARDED_BY(x) RACELAB_THREAD_ANNOTATION(guarded_by(x))
#define ACQUIRE(...) \
  RACELAB_THREAD_ANNOTATION(acquire_capability(__VA_ARGS__))
#define RELEASE(...) \
  RACELAB_THREAD_ANNOTATION(release_capability(__VA_ARGS__))

namespace racelab {
namespace util {

class CAPABILITY("mutex") Mutex {
 public:
  void Lock() ACQUIRE() { mu_.lock(); }
  void Unlock() RELEASE() { mu_.unlock(); }

 private:
  std::mutex mu_;
};

// Holds "mu" for the lifetime of the guard.
class SCOPED_CAPABILITY LockGuard {
 public:
  explicit LockGuard(Mutex& mu) ACQUIRE(mu) : mu_(mu) { mu_.Lock(); }
  ~LockGuard() RELEASE() { mu_.Unlock(); }

 private:
  Mutex& mu_;
};

}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
