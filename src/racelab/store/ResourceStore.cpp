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
#include "store/ResourceStore.h"

#include <memory>
#include <string>

#include "store/FileResourceStore.h"
#include "store/MemoryResourceStore.h"
#include "store/SqliteResourceStore.h"

namespace racelab {
namespace store {

std::unique_ptr<ResourceStore> NewFileResourceStore(const std::string& path) {
  return std::unique_ptr<ResourceStore>(new FileResourceStore(path));
}

std::unique_ptr<ResourceStore> NewSqliteResourceStore(const std::string& path,
                                                      int busy_timeout_ms) {
  return std::unique_ptr<ResourceStore>(
      new SqliteResourceStore(path, busy_timeout_ms));
}

std::unique_ptr<ResourceStore> NewMemoryResourceStore() {
  return std::unique_ptr<ResourceStore>(new MemoryResourceStore());
}

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
