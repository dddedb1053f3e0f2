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
#pragma once

#include <errno.h>

#include <string>

#include "store/ResourceStore.h"
#include "util/common.h"
#include "util/mutex.h"

namespace racelab {
namespace store {

// Each Read() and Write() is atomic on its own, like the file store.  A read
// followed by a write is not.
class MemoryResourceStore : public ResourceStore {
 public:
  MemoryResourceStore() {}

  int Init(const std::string& name, int64_t value) override {
    util::LockGuard lock(mu_);
    record_.Clear();
    record_.set_name(name);
    record_.set_value(value);
    record_.set_last_writer("init");
    record_.set_updated_at_us(util::NowMicros());
    exists_ = true;
    return 0;
  }

  int Read(proto::ResourceRecord* record) override {
    util::LockGuard lock(mu_);
    if (!exists_) return -ENOENT;
    *record = record_;
    return 0;
  }

  int Write(const proto::ResourceRecord& record) override {
    util::LockGuard lock(mu_);
    record_ = record;
    record_.set_updated_at_us(util::NowMicros());
    exists_ = true;
    ++writes_;
    return 0;
  }

  int Teardown() override {
    util::LockGuard lock(mu_);
    record_.Clear();
    exists_ = false;
    return 0;
  }

  std::string Describe() const override { return "memory"; }

  // Number of Write() calls since construction.
  int writes() {
    util::LockGuard lock(mu_);
    return writes_;
  }

 private:
  util::Mutex mu_;
  proto::ResourceRecord record_ GUARDED_BY(mu_);
  bool exists_ GUARDED_BY(mu_) = false;
  int writes_ GUARDED_BY(mu_) = 0;

  DISALLOW_COPY_AND_ASSIGN(MemoryResourceStore);
};

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
