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
#include "util/protobuf.h"

#include <errno.h>

#include <google/protobuf/io/coded_stream.h>
using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;

#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
using google::protobuf::io::ArrayInputStream;
using google::protobuf::io::StringOutputStream;

#include <string>
#include "util/fileutil.h"

namespace racelab {
namespace util {

bool EncodeMessage(const google::protobuf::Message &msg, std::string *buf) {
  uint32_t msg_size = static_cast<uint32_t>(msg.ByteSizeLong());

  buf->clear();
  buf->reserve(msg_size + sizeof(msg_size));

  bool ok = false;
  {
    // "buf" is trimmed to the written size when the streams go away.
    StringOutputStream sos(buf);
    CodedOutputStream cos(&sos);
    cos.WriteLittleEndian32(msg_size);
    ok = msg.SerializeToCodedStream(&cos);
  }
  return ok && buf->size() == msg_size + sizeof(msg_size);
}

bool DecodeMessage(google::protobuf::Message *msg, const void *buf,
                   uint32_t buf_size, uint32_t *msg_size) {
  ArrayInputStream ais(buf, buf_size);
  CodedInputStream cis(&ais);

  if (!cis.ReadLittleEndian32(msg_size)) {
    return false;
  }

  if (buf_size < 4 || *msg_size > buf_size - 4) {
    return false;
  }

  cis.PushLimit(*msg_size);
  return msg->ParseFromCodedStream(&cis);
}

ssize_t WriteMessageToFile(const google::protobuf::Message &msg,
                           const std::string &path) {
  std::string contents;
  if (!EncodeMessage(msg, &contents)) {
    return -EIO;
  }
  return WriteToFile(path, contents, true);
}

ssize_t ReadMessageFromFile(const std::string &path,
                            google::protobuf::Message *msg) {
  std::string content;
  ssize_t res = ReadFromFile(path, &content);
  if (res < 0)
    return res;
  uint32_t msg_size = 0;
  if (!DecodeMessage(msg, content.data(), content.length(), &msg_size)) {
    return -EINVAL;
  }
  return msg_size;
}

}  // namespace util
}  // namespace racelab

// vim:sw=2:ts=2:sts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
