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
#include <errno.h>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>

#include "store/FileResourceStore.h"
#include "store/MemoryResourceStore.h"
#include "store/ResourceStore.h"
#include "store/SqliteResourceStore.h"
#include "util/fileutil.h"
#include "util/testutil.h"

using racelab::proto::ResourceRecord;
using racelab::util::DeleteDirRecursively;
using racelab::util::FileExists;
using racelab::util::WriteToFile;
using racelab::util::test::DoParallel;
using racelab::util::test::NewTestDir;

namespace racelab {
namespace store {
namespace test {

enum class StoreKind { FILE_STORE, MEMORY_STORE, SQLITE_STORE };

class ResourceStoreTest : public ::testing::TestWithParam<StoreKind> {
 public:
  void SetUp() override {
    dir_ = NewTestDir("store");
    if (GetParam() == StoreKind::FILE_STORE) {
      store_ = NewFileResourceStore(dir_ + "/counter.resource");
    } else if (GetParam() == StoreKind::SQLITE_STORE) {
      store_ = NewSqliteResourceStore(dir_ + "/counter.db", 1000);
    } else {
      store_ = NewMemoryResourceStore();
    }
  }

  void TearDown() override {
    store_.reset();
    EXPECT_EQ(0, DeleteDirRecursively(dir_));
  }

 protected:
  int64_t ReadValue() {
    ResourceRecord record;
    EXPECT_EQ(0, store_->Read(&record));
    return record.value();
  }

  std::string dir_;
  std::unique_ptr<ResourceStore> store_;
};

TEST_P(ResourceStoreTest, ReadBeforeInitFails) {
  ResourceRecord record;
  EXPECT_EQ(-ENOENT, store_->Read(&record));
}

TEST_P(ResourceStoreTest, InitCreatesRecord) {
  EXPECT_EQ(0, store_->Init("balance", 1000));
  ResourceRecord record;
  EXPECT_EQ(0, store_->Read(&record));
  EXPECT_EQ("balance", record.name());
  EXPECT_EQ(1000, record.value());
  EXPECT_EQ(0u, record.version());
  EXPECT_GT(record.updated_at_us(), 0u);
}

TEST_P(ResourceStoreTest, InitOverwritesStaleRecord) {
  EXPECT_EQ(0, store_->Init("counter", 0));
  ResourceRecord stale;
  stale.set_name("counter");
  stale.set_value(77);
  stale.set_version(77);
  stale.set_last_writer("previous-run");
  EXPECT_EQ(0, store_->Write(stale));

  EXPECT_EQ(0, store_->Init("counter", 5));
  ResourceRecord record;
  EXPECT_EQ(0, store_->Read(&record));
  EXPECT_EQ(5, record.value());
  EXPECT_EQ(0u, record.version());
  EXPECT_EQ("init", record.last_writer());
}

TEST_P(ResourceStoreTest, WriteReplacesWholeRecord) {
  EXPECT_EQ(0, store_->Init("stock", 10));
  ResourceRecord update;
  update.set_name("stock");
  update.set_value(9);
  update.set_last_writer("buyer-1");
  update.set_version(1);
  EXPECT_EQ(0, store_->Write(update));

  ResourceRecord record;
  EXPECT_EQ(0, store_->Read(&record));
  EXPECT_EQ(9, record.value());
  EXPECT_EQ("buyer-1", record.last_writer());
  EXPECT_EQ(1u, record.version());
}

TEST_P(ResourceStoreTest, NegativeValuesSurvive) {
  EXPECT_EQ(0, store_->Init("balance", -200));
  EXPECT_EQ(-200, ReadValue());
}

TEST_P(ResourceStoreTest, TeardownDiscardsRecord) {
  EXPECT_EQ(0, store_->Init("counter", 1));
  EXPECT_EQ(0, store_->Teardown());
  ResourceRecord record;
  EXPECT_EQ(-ENOENT, store_->Read(&record));
  // Tearing down twice is fine.
  EXPECT_EQ(0, store_->Teardown());
}

TEST_P(ResourceStoreTest, ConcurrentWritersNeverTearRecords) {
  EXPECT_EQ(0, store_->Init("counter", 0));
  std::atomic<int> failures(0);
  DoParallel(8, [this, &failures](int i) {
    for (int n = 0; n < 50; ++n) {
      ResourceRecord record;
      if (store_->Read(&record) != 0 || record.name() != "counter") {
        ++failures;
        continue;
      }
      record.set_value(i * 1000 + n);
      record.set_last_writer("writer-" + std::to_string(i));
      if (store_->Write(record) != 0) ++failures;
    }
  });
  EXPECT_EQ(0, failures.load());
  ResourceRecord record;
  EXPECT_EQ(0, store_->Read(&record));
  EXPECT_EQ("counter", record.name());
}

INSTANTIATE_TEST_CASE_P(Stores, ResourceStoreTest,
                        ::testing::Values(StoreKind::FILE_STORE,
                                          StoreKind::MEMORY_STORE,
                                          StoreKind::SQLITE_STORE));

TEST(FileResourceStoreTest, CorruptRecordIsReported) {
  std::string dir = NewTestDir("store-corrupt");
  FileResourceStore store(dir + "/broken.resource");
  EXPECT_GT(WriteToFile(store.path(), "xy", false), 0);
  ResourceRecord record;
  EXPECT_EQ(-EINVAL, store.Read(&record));
  EXPECT_EQ(0, DeleteDirRecursively(dir));
}

TEST(FileResourceStoreTest, TeardownDeletesTheFile) {
  std::string dir = NewTestDir("store-teardown");
  FileResourceStore store(dir + "/gone.resource");
  EXPECT_EQ(0, store.Init("gone", 3));
  EXPECT_TRUE(FileExists(store.path()));
  EXPECT_EQ(store.path(), store.Describe());
  EXPECT_EQ(0, store.Teardown());
  EXPECT_FALSE(FileExists(store.path()));
  EXPECT_EQ(0, DeleteDirRecursively(dir));
}

class SqliteResourceStoreTest : public ::testing::Test {
 public:
  void SetUp() override { dir_ = NewTestDir("store-sqlite"); }
  void TearDown() override { EXPECT_EQ(0, DeleteDirRecursively(dir_)); }

 protected:
  std::string dir_;
};

TEST_F(SqliteResourceStoreTest, CorruptDatabaseIsReported) {
  SqliteResourceStore store(dir_ + "/broken.db", 100);
  EXPECT_GT(WriteToFile(store.path(), std::string(4096, 'x'), false), 0);
  ResourceRecord record;
  EXPECT_EQ(-EINVAL, store.Read(&record));
}

TEST_F(SqliteResourceStoreTest, RollbackUndoesWrite) {
  SqliteResourceStore store(dir_ + "/balance.db", 100);
  EXPECT_EQ(0, store.Init("balance", 1000));
  EXPECT_TRUE(store.Transactional());

  EXPECT_EQ(0, store.Begin());
  ResourceRecord record;
  EXPECT_EQ(0, store.Read(&record));
  record.set_value(700);
  EXPECT_EQ(0, store.Write(record));
  EXPECT_EQ(0, store.Rollback());

  EXPECT_EQ(0, store.Read(&record));
  EXPECT_EQ(1000, record.value());
}

TEST_F(SqliteResourceStoreTest, CommitPublishesWrite) {
  SqliteResourceStore writer(dir_ + "/balance.db", 100);
  SqliteResourceStore reader(writer.path(), 100);
  EXPECT_EQ(0, writer.Init("balance", 1000));

  EXPECT_EQ(0, writer.Begin());
  ResourceRecord record;
  EXPECT_EQ(0, writer.Read(&record));
  record.set_value(700);
  EXPECT_EQ(0, writer.Write(record));
  EXPECT_EQ(0, writer.Commit());

  EXPECT_EQ(0, reader.Read(&record));
  EXPECT_EQ(700, record.value());
}

TEST_F(SqliteResourceStoreTest, SecondTransactionWaitsThenGivesUp) {
  SqliteResourceStore first(dir_ + "/counter.db", 10);
  SqliteResourceStore second(first.path(), 10);
  EXPECT_EQ(0, first.Init("counter", 0));

  EXPECT_EQ(0, first.Begin());
  EXPECT_EQ(-EBUSY, second.Begin());
  EXPECT_EQ(0, first.Commit());
  EXPECT_EQ(0, second.Begin());
  EXPECT_EQ(0, second.Rollback());
}

TEST_F(SqliteResourceStoreTest, CommitWithoutDatabaseFails) {
  SqliteResourceStore store(dir_ + "/never.db", 10);
  EXPECT_EQ(-EINVAL, store.Commit());
  EXPECT_EQ(-EINVAL, store.Rollback());
  EXPECT_EQ(-ENOENT, store.Begin());
}

TEST_F(SqliteResourceStoreTest, TeardownDeletesTheDatabase) {
  SqliteResourceStore store(dir_ + "/gone.db", 10);
  EXPECT_EQ(0, store.Init("gone", 3));
  EXPECT_TRUE(FileExists(store.path()));
  EXPECT_EQ("sqlite:" + store.path(), store.Describe());
  EXPECT_EQ(0, store.Teardown());
  EXPECT_FALSE(FileExists(store.path()));
  EXPECT_FALSE(FileExists(store.path() + "-journal"));
}

TEST(FileResourceStoreTest, IsNotTransactional) {
  FileResourceStore store("/nonexistent/racelab.resource");
  EXPECT_FALSE(store.Transactional());
  EXPECT_EQ(-ENOTSUP, store.Begin());
  EXPECT_EQ(-ENOTSUP, store.Commit());
  EXPECT_EQ(-ENOTSUP, store.Rollback());
}

TEST(MemoryResourceStoreTest, CountsWrites) {
  MemoryResourceStore store;
  EXPECT_EQ(0, store.Init("counter", 0));
  ResourceRecord record;
  EXPECT_EQ(0, store.Read(&record));
  record.set_value(1);
  EXPECT_EQ(0, store.Write(record));
  EXPECT_EQ(0, store.Write(record));
  EXPECT_EQ(2, store.writes());
}

}  // namespace test
}  // namespace store
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
