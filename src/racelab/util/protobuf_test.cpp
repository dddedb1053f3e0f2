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

#include <string>

#include "proto/Racelab.pb.h"
#include "util/fileutil.h"
#include "util/protobuf.h"
#include "util/testutil.h"

using racelab::proto::ResourceRecord;
using racelab::proto::WorkerReport;

namespace racelab {
namespace util {
namespace test {

class ProtobufTest : public ::testing::Test {
 public:
  void SetUp() override { dir_ = NewTestDir("protobuf"); }
  void TearDown() override { EXPECT_EQ(0, DeleteDirRecursively(dir_)); }

 protected:
  std::string dir_;
};

TEST_F(ProtobufTest, MessagesAreCorrectlySavedAndLoaded) {
  const std::string path = dir_ + "/record";
  ResourceRecord record;
  record.set_name("balance");
  record.set_value(-200);
  record.set_last_writer("4242");
  record.set_version(3);
  EXPECT_GT(WriteMessageToFile(record, path), 0);

  ResourceRecord copy;
  EXPECT_GT(ReadMessageFromFile(path, &copy), 0);
  EXPECT_EQ(record.name(), copy.name());
  EXPECT_EQ(record.value(), copy.value());
  EXPECT_EQ(record.last_writer(), copy.last_writer());
  EXPECT_EQ(record.version(), copy.version());
}

TEST_F(ProtobufTest, RewriteReplacesLongerMessage) {
  const std::string path = dir_ + "/report";
  WorkerReport report;
  report.set_worker_id("a-very-long-worker-identifier");
  report.set_applied(20);
  EXPECT_GT(WriteMessageToFile(report, path), 0);

  WorkerReport shorter;
  shorter.set_worker_id("w1");
  EXPECT_GT(WriteMessageToFile(shorter, path), 0);

  WorkerReport copy;
  EXPECT_GT(ReadMessageFromFile(path, &copy), 0);
  EXPECT_EQ("w1", copy.worker_id());
  EXPECT_FALSE(copy.has_applied());
}

TEST_F(ProtobufTest, MissingFileIsReported) {
  ResourceRecord record;
  EXPECT_EQ(-ENOENT, ReadMessageFromFile(dir_ + "/missing", &record));
}

TEST_F(ProtobufTest, TruncatedMessageIsRejected) {
  ResourceRecord record;
  record.set_name("counter");
  record.set_value(100);
  std::string buf;
  ASSERT_TRUE(EncodeMessage(record, &buf));
  EXPECT_EQ(record.ByteSizeLong() + 4, buf.size());

  const std::string path = dir_ + "/truncated";
  EXPECT_GT(WriteToFile(path, buf.substr(0, buf.size() - 2), false), 0);
  ResourceRecord copy;
  EXPECT_EQ(-EINVAL, ReadMessageFromFile(path, &copy));
}

TEST_F(ProtobufTest, OversizedLengthPrefixIsRejected) {
  // Size field of 0xfffffffe followed by a few bytes of garbage.
  const std::string buf("\xfe\xff\xff\xff" "garbage", 11);
  ResourceRecord record;
  uint32_t msg_size = 0;
  EXPECT_FALSE(DecodeMessage(&record, buf.data(), buf.size(), &msg_size));
  EXPECT_EQ(0xfffffffeu, msg_size);

  const std::string path = dir_ + "/oversized";
  EXPECT_GT(WriteToFile(path, buf, false), 0);
  EXPECT_EQ(-EINVAL, ReadMessageFromFile(path, &record));
}

}  // namespace test
}  // namespace util
}  // namespace racelab

// vim:sw=2:ts=2:sts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
