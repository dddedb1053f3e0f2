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

#include <gtest/gtest.h>

#include <atomic>
#include <string>

#include "util/fileutil.h"
#include "util/testutil.h"

namespace racelab {
namespace util {
namespace test {

class FileUtilTest : public ::testing::Test {
 public:
  void SetUp() override { dir_ = NewTestDir("fileutil"); }
  void TearDown() override {
    if (FileExists(dir_)) EXPECT_EQ(0, DeleteDirRecursively(dir_));
  }

 protected:
  std::string dir_;
};

TEST_F(FileUtilTest, CreateFileExclusiveFailsIfFileExists) {
  const std::string path = dir_ + "/marker";
  EXPECT_EQ(0, CreateFileExclusive(path, "first"));
  EXPECT_EQ(-EEXIST, CreateFileExclusive(path, "second"));
  std::string content;
  EXPECT_EQ(5, ReadFromFile(path, &content));
  EXPECT_EQ("first", content);
}

TEST_F(FileUtilTest, OnlyOneConcurrentExclusiveCreatorWins) {
  const std::string path = dir_ + "/contended";
  std::atomic<int> winners(0);
  DoParallel(16, [&path, &winners](int i) {
    if (CreateFileExclusive(path, std::to_string(i)) == 0) ++winners;
  });
  EXPECT_EQ(1, winners.load());
}

TEST_F(FileUtilTest, AtomicWriteReplacesContents) {
  const std::string path = dir_ + "/data";
  EXPECT_EQ(11, WriteToFile(path, "hello world", true));
  EXPECT_EQ(2, WriteToFile(path, "hi", true));
  std::string content;
  EXPECT_EQ(2, ReadFromFile(path, &content));
  EXPECT_EQ("hi", content);
}

TEST_F(FileUtilTest, AtomicWriteLeavesNoTemporaryFiles) {
  const std::string path = dir_ + "/data";
  for (int i = 0; i < 10; ++i) {
    EXPECT_GT(WriteToFile(path, std::to_string(i), true), 0);
  }
  int entries = 0;
  for (boost::filesystem::directory_iterator it(dir_), end; it != end; ++it) {
    ++entries;
  }
  EXPECT_EQ(1, entries);
}

TEST_F(FileUtilTest, MissingFilesAreReported) {
  std::string content;
  EXPECT_EQ(-ENOENT, ReadFromFile(dir_ + "/nothing", &content));
  EXPECT_EQ(-ENOENT, DeleteFile(dir_ + "/nothing"));
  EXPECT_EQ(-ENOENT, WriteToFile(dir_ + "/no/such/dir", "x", true));
}

TEST_F(FileUtilTest, DirectoriesAreCreatedAndDeleted) {
  const std::string nested = dir_ + "/a/b/c";
  EXPECT_EQ(0, CreateOrUseDir(nested));
  EXPECT_EQ(0, CreateOrUseDir(nested));
  EXPECT_EQ(0, CreateFileExclusive(nested + "/f", "x"));
  EXPECT_EQ(0, DeleteDirRecursively(dir_));
  EXPECT_FALSE(FileExists(dir_));
}

}  // namespace test
}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
