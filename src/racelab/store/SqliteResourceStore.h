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

#include <sqlite3.h>

#include <string>

#include "store/ResourceStore.h"
#include "util/common.h"
#include "util/mutex.h"

namespace racelab {
namespace store {

// The record is the only row of table "resource" in an SQLite database at
// "path".  Without transactions every Read() and Write() commits on its own,
// so a read followed by a write races exactly like the file store.  Between
// Begin() and Commit() the database keeps other workers out: Begin() takes
// the database's write lock up front ("BEGIN IMMEDIATE"), waiting up to the
// busy timeout for it.
//
// Threads may share one instance for plain reads and writes, but each worker
// running transactions needs its own.
class SqliteResourceStore : public ResourceStore {
 public:
  SqliteResourceStore(const std::string& path, int busy_timeout_ms);
  ~SqliteResourceStore();

  // Creates the database if needed.  Closes it again afterwards, so worker
  // processes forked right after Init() never inherit an open connection.
  int Init(const std::string& name, int64_t value) override;
  int Read(proto::ResourceRecord* record) override;
  int Write(const proto::ResourceRecord& record) override;
  int Teardown() override;
  std::string Describe() const override { return "sqlite:" + path_; }

  bool Transactional() const override { return true; }
  int Begin() override;
  int Commit() override;
  int Rollback() override;

  const std::string& path() const { return path_; }

 private:
  // The following helpers expect "mu_" to be held.
  int Open(bool create);
  void Close();
  int Exec(const char* sql);
  int Store(const char* sql, const proto::ResourceRecord& record);
  int Fail(int rc, const char* what);

  const std::string path_;
  const int busy_timeout_ms_;

  util::Mutex mu_;
  sqlite3* db_ = nullptr;

  DISALLOW_COPY_AND_ASSIGN(SqliteResourceStore);
};

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
