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
#include "util/fileutil.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/filesystem.hpp>
#include <glog/logging.h>

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace fs = boost::filesystem;

namespace racelab {
namespace util {

namespace {

std::atomic<uint64_t> temp_file_seq(0);

ssize_t WriteAll(int fd, const std::string& contents) {
  size_t written = 0;
  while (written < contents.size()) {
    ssize_t n = write(fd, contents.data() + written, contents.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -errno;
    }
    written += n;
  }
  return written;
}

// Unique per process, thread and call, so that concurrent writers of the same
// path never share a temporary file.
std::string TempPathFor(const std::string& path) {
  size_t tid = std::hash<std::thread::id>()(std::this_thread::get_id());
  return path + ".tmp." + std::to_string(getpid()) + "." +
         std::to_string(tid) + "." + std::to_string(temp_file_seq++);
}

ssize_t WriteFileInPlace(const std::string& path, const std::string& contents,
                         int flags) {
  int fd = open(path.c_str(), flags, 0644);
  if (fd < 0) {
    int ret = -errno;
    VLOG(2) << "cannot open " << path << ": " << strerror(errno);
    return ret;
  }
  ssize_t ret = WriteAll(fd, contents);
  if (close(fd) != 0 && ret >= 0) {
    ret = -errno;
  }
  return ret;
}

}  // anonymous namespace

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

int CreateFileExclusive(const std::string& path, const std::string& contents) {
  int fd = open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
  if (fd < 0) {
    return -errno;
  }
  ssize_t ret = WriteAll(fd, contents);
  if (close(fd) != 0 && ret >= 0) {
    ret = -errno;
  }
  if (ret < 0) {
    LOG(ERROR) << "could not fill " << path << ": " << strerror(-ret);
    unlink(path.c_str());
    return ret;
  }
  return 0;
}

ssize_t WriteToFile(const std::string& path, const std::string& contents,
                    bool atomic) {
  if (!atomic) {
    return WriteFileInPlace(path, contents, O_CREAT | O_TRUNC | O_WRONLY);
  }
  std::string tmp = TempPathFor(path);
  ssize_t ret = WriteFileInPlace(tmp, contents, O_CREAT | O_EXCL | O_WRONLY);
  if (ret < 0) {
    unlink(tmp.c_str());
    return ret;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    ret = -errno;
    LOG(ERROR) << "cannot rename " << tmp << " to " << path << ": "
               << strerror(errno);
    unlink(tmp.c_str());
  }
  return ret;
}

ssize_t ReadFromFile(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return -errno;
  }
  content->clear();
  char buf[4096];
  ssize_t ret = 0;
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      ret = -errno;
      break;
    }
    if (n == 0) break;
    content->append(buf, n);
  }
  close(fd);
  return ret < 0 ? ret : static_cast<ssize_t>(content->size());
}

int DeleteFile(const std::string& path) {
  if (unlink(path.c_str()) != 0) {
    return -errno;
  }
  return 0;
}

int CreateOrUseDir(const std::string& path) {
  boost::system::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    LOG(ERROR) << "cannot create directory " << path << ": " << ec.message();
    return -ec.value();
  }
  return fs::is_directory(path, ec) ? 0 : -ENOTDIR;
}

int DeleteDirRecursively(const std::string& path) {
  boost::system::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG(ERROR) << "cannot delete directory " << path << ": " << ec.message();
    return -ec.value();
  }
  return 0;
}

}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
