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
// Scenarios are ScenarioConfig parameterizations of the harness.  The three
// presets are:
//
//   counter:    5 workers increment a counter starting at 0, 20 times each.
//   bank:       4 customers withdraw 300 from a balance of 1000.
//   inventory:  15 buyers each buy 1 of 10 items in stock.
//   buffer:     2 producers and 2 consumers move 5 units each through a
//               buffer holding at most 5.
//
// Any of them runs against an SQLite database instead of a file with
// "store: SQLITE_STORE"; locked runs then rely on database transactions.

#pragma once

#include <string>
#include <vector>

#include "proto/Racelab.pb.h"

namespace racelab {
namespace harness {

std::vector<std::string> PresetNames();

// Returns false if there is no preset called "name".
bool GetPreset(const std::string& name, proto::ScenarioConfig* config);

/**
 * Parse a ScenarioConfig in protobuf text format, e.g.
 *
 *   name: "tickets"
 *   shape: CHECK_THEN_ACT
 *   initial_value: 50
 *   workers: 8
 *
 * Fields not in the file keep their defaults.
 *
 * @return 0 on success, -ENOENT if the file does not exist, -EINVAL if it
 * cannot be parsed.
 */
int LoadScenarioFile(const std::string& path, proto::ScenarioConfig* config);

// Returns false and explains in "why" if the harness cannot run "config".
bool ValidateScenario(const proto::ScenarioConfig& config, std::string* why);

// e.g. "bank (locked, 4 processes x 1 x 300)".
std::string DescribeScenario(const proto::ScenarioConfig& config);

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
