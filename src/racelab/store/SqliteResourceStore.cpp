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
#include "store/SqliteResourceStore.h"

#include <errno.h>
#include <string.h>

#include <glog/logging.h>

#include <initializer_list>
#include <string>

#include "util/fileutil.h"

using racelab::proto::ResourceRecord;

namespace racelab {
namespace store {

namespace {

const char kCreateTable[] =
    "CREATE TABLE IF NOT EXISTS resource ("
    "id INTEGER PRIMARY KEY CHECK (id = 1), "
    "name TEXT NOT NULL, "
    "value INTEGER NOT NULL, "
    "last_writer TEXT, "
    "updated_at_us INTEGER, "
    "version INTEGER, "
    "produced INTEGER, "
    "consumed INTEGER)";

const char kInsertRecord[] =
    "INSERT OR REPLACE INTO resource (id, name, value, last_writer, "
    "updated_at_us, version, produced, consumed) "
    "VALUES (1, ?1, ?2, ?3, ?4, ?5, ?6, ?7)";

const char kUpdateRecord[] =
    "UPDATE resource SET name = ?1, value = ?2, last_writer = ?3, "
    "updated_at_us = ?4, version = ?5, produced = ?6, consumed = ?7 "
    "WHERE id = 1";

const char kSelectRecord[] =
    "SELECT name, value, last_writer, updated_at_us, version, produced, "
    "consumed FROM resource WHERE id = 1";

// Finalizes a prepared statement when going out of scope.
class Statement {
 public:
  Statement() {}
  ~Statement() { sqlite3_finalize(stmt_); }

  sqlite3_stmt** out() { return &stmt_; }
  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_ = nullptr;
  DISALLOW_COPY_AND_ASSIGN(Statement);
};

int ToErrno(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return 0;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return -EBUSY;
    case SQLITE_CANTOPEN:
      return -ENOENT;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_MISMATCH:
      return -EINVAL;
    case SQLITE_NOMEM:
      return -ENOMEM;
    default:
      return -EIO;
  }
}

std::string ColumnString(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text == nullptr ? std::string()
                         : std::string(reinterpret_cast<const char*>(text));
}

}  // namespace

SqliteResourceStore::SqliteResourceStore(const std::string& path,
                                         int busy_timeout_ms)
    : path_(path), busy_timeout_ms_(busy_timeout_ms) {
  CHECK_GE(busy_timeout_ms_, 0);
}

SqliteResourceStore::~SqliteResourceStore() {
  util::LockGuard lock(mu_);
  Close();
}

int SqliteResourceStore::Open(bool create) {
  if (db_ != nullptr) {
    return 0;
  }
  int flags = SQLITE_OPEN_READWRITE | (create ? SQLITE_OPEN_CREATE : 0);
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    LOG(ERROR) << "cannot open database " << path_ << ": "
               << (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    sqlite3_close(db);
    return ToErrno(rc);
  }
  sqlite3_busy_timeout(db, busy_timeout_ms_);
  db_ = db;
  return 0;
}

void SqliteResourceStore::Close() {
  if (db_ == nullptr) {
    return;
  }
  int rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    LOG(WARNING) << "closing " << path_ << ": " << sqlite3_errstr(rc);
  }
  db_ = nullptr;
}

int SqliteResourceStore::Fail(int rc, const char* what) {
  LOG(ERROR) << "cannot " << what << " " << path_ << ": "
             << sqlite3_errmsg(db_);
  return ToErrno(rc);
}

int SqliteResourceStore::Exec(const char* sql) {
  char* errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    LOG(ERROR) << "'" << sql << "' failed on " << path_ << ": "
               << (errmsg != nullptr ? errmsg : sqlite3_errstr(rc));
    sqlite3_free(errmsg);
    return ToErrno(rc);
  }
  return 0;
}

int SqliteResourceStore::Store(const char* sql, const ResourceRecord& record) {
  Statement stmt;
  int rc = sqlite3_prepare_v2(db_, sql, -1, stmt.out(), nullptr);
  if (rc != SQLITE_OK) {
    return Fail(rc, "prepare write of");
  }
  sqlite3_bind_text(stmt.get(), 1, record.name().c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, record.value());
  sqlite3_bind_text(stmt.get(), 3, record.last_writer().c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 4, util::NowMicros());
  sqlite3_bind_int64(stmt.get(), 5, record.version());
  sqlite3_bind_int64(stmt.get(), 6, record.produced());
  sqlite3_bind_int64(stmt.get(), 7, record.consumed());
  rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return Fail(rc, "write");
  }
  if (sqlite3_changes(db_) == 0) {
    LOG(ERROR) << "no record to write in " << path_;
    return -ENOENT;
  }
  return 0;
}

int SqliteResourceStore::Init(const std::string& name, int64_t value) {
  util::LockGuard lock(mu_);
  int ret = Open(true);
  if (ret < 0) return ret;

  ResourceRecord record;
  record.set_name(name);
  record.set_value(value);
  record.set_last_writer("init");
  record.set_version(0);
  ret = Exec(kCreateTable);
  if (ret == 0) ret = Store(kInsertRecord, record);
  Close();
  if (ret == 0) {
    VLOG(1) << "initialized " << name << " = " << value << " in " << path_;
  }
  return ret;
}

int SqliteResourceStore::Read(ResourceRecord* record) {
  util::LockGuard lock(mu_);
  int ret = Open(false);
  if (ret < 0) return ret;

  Statement stmt;
  int rc = sqlite3_prepare_v2(db_, kSelectRecord, -1, stmt.out(), nullptr);
  if (rc != SQLITE_OK) {
    return Fail(rc, "prepare read of");
  }
  rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    LOG(ERROR) << "no record in " << path_;
    return -ENOENT;
  }
  if (rc != SQLITE_ROW) {
    return Fail(rc, "read");
  }
  record->Clear();
  record->set_name(ColumnString(stmt.get(), 0));
  record->set_value(sqlite3_column_int64(stmt.get(), 1));
  record->set_last_writer(ColumnString(stmt.get(), 2));
  record->set_updated_at_us(sqlite3_column_int64(stmt.get(), 3));
  record->set_version(sqlite3_column_int64(stmt.get(), 4));
  record->set_produced(sqlite3_column_int64(stmt.get(), 5));
  record->set_consumed(sqlite3_column_int64(stmt.get(), 6));
  return 0;
}

int SqliteResourceStore::Write(const ResourceRecord& record) {
  util::LockGuard lock(mu_);
  int ret = Open(false);
  if (ret < 0) return ret;
  return Store(kUpdateRecord, record);
}

int SqliteResourceStore::Teardown() {
  util::LockGuard lock(mu_);
  Close();
  int ret = 0;
  for (const char* suffix : {"", "-journal", "-wal", "-shm"}) {
    int del = util::DeleteFile(path_ + suffix);
    if (del < 0 && del != -ENOENT) {
      LOG(ERROR) << "cannot delete " << path_ << suffix << ": "
                 << strerror(-del);
      if (ret == 0) ret = del;
    }
  }
  return ret;
}

int SqliteResourceStore::Begin() {
  util::LockGuard lock(mu_);
  int ret = Open(false);
  if (ret < 0) return ret;
  return Exec("BEGIN IMMEDIATE");
}

int SqliteResourceStore::Commit() {
  util::LockGuard lock(mu_);
  if (db_ == nullptr) return -EINVAL;
  return Exec("COMMIT");
}

int SqliteResourceStore::Rollback() {
  util::LockGuard lock(mu_);
  if (db_ == nullptr) return -EINVAL;
  return Exec("ROLLBACK");
}

}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
