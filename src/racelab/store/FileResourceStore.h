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

#include <string>

#include "store/ResourceStore.h"
#include "util/common.h"

namespace racelab {
namespace store {

// The record is stored as a size-prefixed protobuf message.  Every Write()
// goes to a temporary file renamed over the record, so any number of
// processes can read and write it without seeing torn records.
class FileResourceStore : public ResourceStore {
 public:
  explicit FileResourceStore(const std::string& path) : path_(path) {}

  int Init(const std::string& name, int64_t value) override;
  int Read(proto::ResourceRecord* record) override;
  int Write(const proto::ResourceRecord& record) override;
  int Teardown() override;
  std::string Describe() const override { return path_; }

  const std::string& path() const { return path_; }

 private:
  const std::string path_;

  DISALLOW_COPY_AND_ASSIGN(FileResourceStore);
};

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
