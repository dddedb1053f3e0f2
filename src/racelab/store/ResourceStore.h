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
// A ResourceStore holds the single ResourceRecord contended by the workers of
// one harness run.  Reads and writes always move the whole record; a reader
// may see a stale record but never a partially written one.
//
// A store provides no mutual exclusion across a read and the following write
// unless it is transactional.  Otherwise that is the job of lock::FileMutex.

#pragma once

#include <errno.h>
#include <stdint.h>

#include <memory>
#include <string>

#include "proto/Racelab.pb.h"

namespace racelab {
namespace store {

class ResourceStore {
 public:
  virtual ~ResourceStore() {}

  /**
   * Create the record with the given name and value, replacing any record left
   * over by an earlier run.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  virtual int Init(const std::string& name, int64_t value) = 0;

  /**
   * @return 0 on success, -ENOENT if the record does not exist, -EINVAL if it
   * is corrupt, or another negative error code.
   */
  virtual int Read(proto::ResourceRecord* record) = 0;

  /**
   * Replace the record.  "updated_at_us" is stamped by the store.
   *
   * @return 0 on success, otherwise a negative error code.
   */
  virtual int Write(const proto::ResourceRecord& record) = 0;

  // Discard the record.  Returns 0 also if there was nothing to discard.
  virtual int Teardown() = 0;

  // Human-readable location of the record, for logs.
  virtual std::string Describe() const = 0;

  // True if Begin(), Commit() and Rollback() are supported.  A transactional
  // store makes everything between Begin() and Commit() atomic and isolated
  // from other workers.
  virtual bool Transactional() const { return false; }

  /**
   * Start a transaction.  Reads and writes until Commit() or Rollback()
   * belong to it.
   *
   * @return 0 on success, -EBUSY if another worker kept the store busy for
   * too long, or another negative error code.
   */
  virtual int Begin() { return -ENOTSUP; }

  // Make the writes of the transaction durable.
  virtual int Commit() { return -ENOTSUP; }

  // Undo every write of the transaction.
  virtual int Rollback() { return -ENOTSUP; }
};

// Store backed by one file that is replaced on every write.
std::unique_ptr<ResourceStore> NewFileResourceStore(const std::string& path);

// Store backed by one row of an SQLite database.  Waits up to
// "busy_timeout_ms" for other connections to release the database.
std::unique_ptr<ResourceStore> NewSqliteResourceStore(const std::string& path,
                                                      int busy_timeout_ms);

// Store kept in the memory of the current process.  Threads of this process
// can share it; other processes cannot.
std::unique_ptr<ResourceStore> NewMemoryResourceStore();

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
