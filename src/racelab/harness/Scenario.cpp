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
#include "harness/Scenario.h"

#include <errno.h>
#include <string.h>

#include <glog/logging.h>
#include <google/protobuf/text_format.h>

#include <sstream>
#include <string>
#include <vector>

#include "util/fileutil.h"

using racelab::proto::ScenarioConfig;

namespace racelab {
namespace harness {

// Locked runs of the presets hold the lock for up to the full delay, so
// waiters get more attempts than the library default.
static const int kPresetLockAttempts = 500;

// Longest delay or pause a scenario may ask for.
static const int kMaxDelayMs = 10 * 60 * 1000;

std::vector<std::string> PresetNames() {
  return {"counter", "bank", "inventory", "buffer"};
}

bool GetPreset(const std::string& name, ScenarioConfig* config) {
  config->Clear();
  config->set_name(name);
  config->set_lock_max_attempts(kPresetLockAttempts);
  if (name == "counter") {
    config->set_shape(proto::READ_MODIFY_WRITE);
    config->set_initial_value(0);
    config->set_workers(5);
    config->set_repetitions(20);
    config->set_amount(1);
    config->set_delay_max_ms(10);
    config->set_pause_max_ms(5);
  } else if (name == "bank") {
    config->set_shape(proto::CHECK_THEN_ACT);
    config->set_initial_value(1000);
    config->set_workers(4);
    config->set_repetitions(1);
    config->set_amount(300);
    config->set_delay_max_ms(100);
    config->set_pause_max_ms(50);
  } else if (name == "inventory") {
    config->set_shape(proto::CHECK_THEN_ACT);
    config->set_initial_value(10);
    config->set_workers(15);
    config->set_repetitions(1);
    config->set_amount(1);
    config->set_delay_max_ms(150);
    config->set_pause_max_ms(100);
  } else if (name == "buffer") {
    config->set_shape(proto::BOUNDED_BUFFER);
    config->set_initial_value(0);
    config->set_capacity(5);
    config->set_workers(4);
    config->set_consumers(2);
    config->set_repetitions(5);
    config->set_amount(1);
    config->set_delay_max_ms(50);
    config->set_pause_max_ms(100);
  } else {
    config->Clear();
    return false;
  }
  return true;
}

int LoadScenarioFile(const std::string& path, ScenarioConfig* config) {
  std::string text;
  ssize_t ret = util::ReadFromFile(path, &text);
  if (ret < 0) {
    LOG(ERROR) << "cannot read scenario file " << path << ": "
               << strerror(-ret);
    return ret;
  }
  config->Clear();
  if (!google::protobuf::TextFormat::ParseFromString(text, config)) {
    LOG(ERROR) << "cannot parse scenario file " << path;
    return -EINVAL;
  }
  return 0;
}

bool ValidateScenario(const ScenarioConfig& config, std::string* why) {
  std::ostringstream oss;
  if (config.name().empty() ||
      config.name().find('/') != std::string::npos) {
    oss << "bad scenario name '" << config.name() << "'";
  } else if (config.workers() < 1) {
    oss << "need at least one worker";
  } else if (config.repetitions() < 0) {
    oss << "repetitions must not be negative";
  } else if (config.amount() <= 0) {
    oss << "amount must be positive";
  } else if (config.delay_min_ms() < 0 ||
             config.delay_min_ms() > config.delay_max_ms()) {
    oss << "bad delay range [" << config.delay_min_ms() << ", "
        << config.delay_max_ms() << "]";
  } else if (config.delay_max_ms() > kMaxDelayMs) {
    oss << "delay_max_ms exceeds " << kMaxDelayMs;
  } else if (config.pause_max_ms() < 0) {
    oss << "pause must not be negative";
  } else if (config.pause_max_ms() > kMaxDelayMs) {
    oss << "pause_max_ms exceeds " << kMaxDelayMs;
  } else if (config.lock_max_attempts() < 1) {
    oss << "lock_max_attempts must be positive";
  } else if (config.lock_retry_delay_ms() < 0) {
    oss << "lock_retry_delay_ms must not be negative";
  } else if (config.worker_timeout_ms() < 0) {
    oss << "worker_timeout_ms must not be negative";
  } else if (config.work_dir().empty()) {
    oss << "work_dir is empty";
  } else if (config.shape() == proto::BOUNDED_BUFFER &&
             config.capacity() < config.amount()) {
    oss << "capacity " << config.capacity() << " cannot hold amount "
        << config.amount();
  } else if (config.shape() == proto::BOUNDED_BUFFER &&
             (config.initial_value() < 0 ||
              config.initial_value() > config.capacity())) {
    oss << "initial_value must be within [0, " << config.capacity() << "]";
  } else if (config.consumers() < 0 ||
             config.consumers() > config.workers()) {
    oss << "consumers must be within [0, " << config.workers() << "]";
  } else {
    return true;
  }
  if (why != nullptr) {
    *why = oss.str();
  }
  return false;
}

std::string DescribeScenario(const ScenarioConfig& config) {
  std::ostringstream oss;
  oss << config.name() << " ("
      << (config.synchronized() ? "locked" : "unsynchronized") << ", ";
  if (config.store() == proto::SQLITE_STORE) {
    oss << "sqlite, ";
  }
  oss << config.workers()
      << (config.launcher() == proto::THREAD ? " threads" : " processes")
      << " x " << config.repetitions() << " x " << config.amount();
  if (config.shape() == proto::BOUNDED_BUFFER) {
    oss << ", " << config.consumers() << " consuming, capacity "
        << config.capacity();
  }
  oss << ")";
  return oss.str();
}

}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
