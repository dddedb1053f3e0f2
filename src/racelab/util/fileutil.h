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
// File helpers.  Unless noted otherwise, functions return 0 (or a byte count)
// on success and a negative errno on failure.

#pragma once

#include <sys/types.h>

#include <string>

namespace racelab {
namespace util {

bool FileExists(const std::string& path);

// Create "path" only if it does not exist yet and fill it with "contents".
// The existence check and the creation are one open(O_CREAT | O_EXCL) call.
// Returns -EEXIST if the file is already there.
int CreateFileExclusive(const std::string& path, const std::string& contents);

// Write "contents" to "path", replacing whatever was there.  When "atomic" is
// true the data goes to a private temporary file that is then renamed over
// "path", so concurrent readers see either the old or the new contents in
// full.
ssize_t WriteToFile(const std::string& path, const std::string& contents,
                    bool atomic);

// Return the number of bytes read into "content".
ssize_t ReadFromFile(const std::string& path, std::string* content);

// Returns -ENOENT if the file does not exist.
int DeleteFile(const std::string& path);

int CreateOrUseDir(const std::string& path);

int DeleteDirRecursively(const std::string& path);

}  // namespace util
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
