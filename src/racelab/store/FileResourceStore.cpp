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
#include "store/FileResourceStore.h"

#include <errno.h>
#include <string.h>

#include <glog/logging.h>

#include <string>

#include "util/fileutil.h"
#include "util/protobuf.h"

using racelab::proto::ResourceRecord;

namespace racelab {
namespace store {

int FileResourceStore::Init(const std::string& name, int64_t value) {
  ResourceRecord record;
  record.set_name(name);
  record.set_value(value);
  record.set_last_writer("init");
  record.set_version(0);
  int ret = Write(record);
  if (ret == 0) {
    VLOG(1) << "initialized " << name << " = " << value << " at " << path_;
  }
  return ret;
}

int FileResourceStore::Read(ResourceRecord* record) {
  record->Clear();
  ssize_t ret = util::ReadMessageFromFile(path_, record);
  if (ret < 0) {
    LOG(ERROR) << "cannot read resource " << path_ << ": " << strerror(-ret);
    return static_cast<int>(ret);
  }
  return 0;
}

int FileResourceStore::Write(const ResourceRecord& record) {
  ResourceRecord stamped(record);
  stamped.set_updated_at_us(util::NowMicros());
  ssize_t ret = util::WriteMessageToFile(stamped, path_);
  if (ret < 0) {
    LOG(ERROR) << "cannot write resource " << path_ << ": " << strerror(-ret);
    return static_cast<int>(ret);
  }
  return 0;
}

int FileResourceStore::Teardown() {
  int ret = util::DeleteFile(path_);
  if (ret == -ENOENT) {
    return 0;
  }
  if (ret < 0) {
    LOG(ERROR) << "cannot delete resource " << path_ << ": " << strerror(-ret);
  }
  return ret;
}

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
