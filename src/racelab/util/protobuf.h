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

#include <stdint.h>
#include <sys/types.h>

#include <google/protobuf/message.h>
#include <string>

namespace racelab {
namespace util {

// Serialize "msg" into "buf" prefixed by its little-endian 32-bit size.
bool EncodeMessage(const google::protobuf::Message &msg, std::string *buf);

bool DecodeMessage(google::protobuf::Message *msg, const void *buf,
                   uint32_t buf_size, uint32_t *msg_size);

// The file is always rewritten as a whole; readers never see a partially
// written message.
ssize_t WriteMessageToFile(const google::protobuf::Message &msg,
                           const std::string &path);

// Returns the message size, -ENOENT if the file is missing, or -EINVAL if its
// content is not a valid message.
ssize_t ReadMessageFromFile(const std::string &path,
                            google::protobuf::Message *msg);

}  // namespace util
}  // namespace racelab

// vim:sw=2:ts=2:sts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
