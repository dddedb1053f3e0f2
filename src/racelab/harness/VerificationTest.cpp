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
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "harness/Verification.h"

namespace racelab {
namespace harness {
namespace test {

static WorkerOutcome Completed(const std::string& id, int attempted,
                               int applied, int64_t amount) {
  WorkerOutcome outcome;
  outcome.worker_id = id;
  outcome.exit_status = kWorkerOk;
  outcome.has_report = true;
  outcome.report.set_worker_id(id);
  outcome.report.set_attempted(attempted);
  outcome.report.set_applied(applied);
  outcome.report.set_rejected(attempted - applied);
  outcome.report.set_amount(amount);
  return outcome;
}

static proto::ScenarioConfig Counter() {
  proto::ScenarioConfig config;
  config.set_initial_value(0);
  config.set_amount(1);
  return config;
}

static proto::ScenarioConfig Bank() {
  proto::ScenarioConfig config;
  config.set_shape(proto::CHECK_THEN_ACT);
  config.set_initial_value(1000);
  config.set_amount(300);
  return config;
}

TEST(VerificationTest, ExactCounter) {
  std::vector<WorkerOutcome> outcomes;
  for (int i = 0; i < 5; ++i) {
    outcomes.push_back(Completed("w" + std::to_string(i), 20, 20, 1));
  }
  Verification v = VerifyFinalState(Counter(), 100, outcomes);
  EXPECT_EQ(100, v.expected);
  EXPECT_EQ(0, v.delta);
  EXPECT_EQ(0, v.lost);
  EXPECT_TRUE(v.consistent);
  EXPECT_FALSE(v.race_detected);
  EXPECT_FALSE(v.inconclusive);
  EXPECT_EQ(0, v.failed_workers);
}

TEST(VerificationTest, LostUpdates) {
  std::vector<WorkerOutcome> outcomes;
  for (int i = 0; i < 5; ++i) {
    outcomes.push_back(Completed("w" + std::to_string(i), 20, 20, 1));
  }
  Verification v = VerifyFinalState(Counter(), 63, outcomes);
  EXPECT_EQ(100, v.expected);
  EXPECT_EQ(-37, v.delta);
  EXPECT_EQ(37, v.lost);
  EXPECT_TRUE(v.race_detected);
  EXPECT_NE(std::string::npos, v.Summary().find("RACE DETECTED"));
}

TEST(VerificationTest, LostIsTheMissingValue) {
  proto::ScenarioConfig config = Counter();
  config.set_amount(5);
  std::vector<WorkerOutcome> outcomes = {Completed("a", 4, 4, 5),
                                         Completed("b", 4, 4, 5)};
  Verification v = VerifyFinalState(config, 30, outcomes);
  EXPECT_EQ(40, v.expected);
  EXPECT_EQ(10, v.lost);

  // A shortfall that is not a multiple of the amount is reported as is.
  v = VerifyFinalState(config, 33, outcomes);
  EXPECT_EQ(-7, v.delta);
  EXPECT_EQ(7, v.lost);
  EXPECT_TRUE(v.race_detected);

  // Shortfalls beyond 32 bits are kept whole.
  const int64_t big = 3000000000LL;
  config.set_amount(big);
  outcomes = {Completed("a", 1, 1, big), Completed("b", 1, 1, big)};
  v = VerifyFinalState(config, big, outcomes);
  EXPECT_EQ(2 * big, v.expected);
  EXPECT_EQ(big, v.lost);
}

TEST(VerificationTest, FailedWorkerOnlyCountsWhatItApplied) {
  std::vector<WorkerOutcome> outcomes = {Completed("a", 10, 10, 1),
                                         Completed("b", 4, 3, 1)};
  outcomes[1].exit_status = kWorkerLockExhausted;
  outcomes[1].report.set_rejected(0);
  outcomes[1].report.set_lock_failures(1);
  Verification v = VerifyFinalState(Counter(), 13, outcomes);
  EXPECT_EQ(13, v.expected);
  EXPECT_FALSE(v.race_detected);
  EXPECT_EQ(1, v.failed_workers);
  EXPECT_FALSE(v.inconclusive);
}

TEST(VerificationTest, MissingReportIsInconclusive) {
  std::vector<WorkerOutcome> outcomes = {Completed("a", 10, 10, 1)};
  WorkerOutcome killed;
  killed.worker_id = "b";
  killed.timed_out = true;
  outcomes.push_back(killed);
  Verification v = VerifyFinalState(Counter(), 14, outcomes);
  EXPECT_EQ(10, v.expected);
  EXPECT_TRUE(v.inconclusive);
  EXPECT_EQ(1, v.failed_workers);
  EXPECT_NE(std::string::npos, v.Summary().find("inconclusive"));
}

TEST(VerificationTest, LockedBankRejectsFourthWithdrawal) {
  std::vector<WorkerOutcome> outcomes = {
      Completed("c0", 1, 1, 300), Completed("c1", 1, 1, 300),
      Completed("c2", 1, 0, 300), Completed("c3", 1, 1, 300)};
  Verification v = VerifyFinalState(Bank(), 100, outcomes);
  EXPECT_EQ(100, v.expected);
  EXPECT_EQ(3, v.succeeded);
  EXPECT_EQ(1, v.rejected);
  EXPECT_EQ(4, v.attempted);
  EXPECT_TRUE(v.invariant_held);
  EXPECT_TRUE(v.consistent);
  EXPECT_EQ(0, v.oversold);
  EXPECT_FALSE(v.race_detected);
}

TEST(VerificationTest, Overdraft) {
  std::vector<WorkerOutcome> outcomes;
  for (int i = 0; i < 4; ++i) {
    outcomes.push_back(Completed("c" + std::to_string(i), 1, 1, 300));
  }
  Verification v = VerifyFinalState(Bank(), -200, outcomes);
  EXPECT_EQ(-200, v.expected);
  EXPECT_TRUE(v.consistent);
  EXPECT_FALSE(v.invariant_held);
  EXPECT_EQ(200, v.oversold);
  EXPECT_TRUE(v.race_detected);
}

// Every withdrawal succeeded against a stale balance: the balance stays
// positive but does not match the withdrawals.
TEST(VerificationTest, StaleDebitIsInconsistent) {
  std::vector<WorkerOutcome> outcomes;
  for (int i = 0; i < 4; ++i) {
    outcomes.push_back(Completed("c" + std::to_string(i), 1, 1, 300));
  }
  Verification v = VerifyFinalState(Bank(), 700, outcomes);
  EXPECT_EQ(-200, v.expected);
  EXPECT_TRUE(v.invariant_held);
  EXPECT_FALSE(v.consistent);
  EXPECT_EQ(200, v.oversold);
  EXPECT_TRUE(v.race_detected);
}

TEST(VerificationTest, LockedInventorySellsOut) {
  proto::ScenarioConfig config;
  config.set_shape(proto::CHECK_THEN_ACT);
  config.set_initial_value(10);
  config.set_amount(1);
  std::vector<WorkerOutcome> outcomes;
  for (int i = 0; i < 15; ++i) {
    outcomes.push_back(
        Completed("b" + std::to_string(i), 1, i < 10 ? 1 : 0, 1));
  }
  Verification v = VerifyFinalState(config, 0, outcomes);
  EXPECT_EQ(10, v.succeeded);
  EXPECT_EQ(5, v.rejected);
  EXPECT_FALSE(v.race_detected);
}

static proto::ScenarioConfig Buffer() {
  proto::ScenarioConfig config;
  config.set_shape(proto::BOUNDED_BUFFER);
  config.set_initial_value(0);
  config.set_amount(1);
  config.set_capacity(5);
  return config;
}

static WorkerOutcome Consumed(const std::string& id, int attempted,
                              int applied) {
  WorkerOutcome outcome = Completed(id, attempted, applied, 1);
  outcome.report.set_role(proto::CONSUMER);
  return outcome;
}

TEST(VerificationTest, BufferCountMatchesProducedMinusConsumed) {
  std::vector<WorkerOutcome> outcomes = {
      Completed("p1", 5, 5, 1), Completed("p2", 5, 3, 1),
      Consumed("c1", 5, 4), Consumed("c2", 5, 2)};
  Verification v = VerifyFinalState(Buffer(), 2, outcomes);
  EXPECT_EQ(8, v.produced);
  EXPECT_EQ(6, v.consumed);
  EXPECT_EQ(2, v.expected);
  EXPECT_EQ(6, v.rejected);
  EXPECT_TRUE(v.invariant_held);
  EXPECT_TRUE(v.consistent);
  EXPECT_FALSE(v.race_detected);
  EXPECT_NE(std::string::npos, v.Summary().find("produced 8, consumed 6"));
}

TEST(VerificationTest, BufferOverflowBreaksTheInvariant) {
  std::vector<WorkerOutcome> outcomes = {Completed("p1", 3, 3, 1),
                                         Completed("p2", 3, 3, 1)};
  Verification v = VerifyFinalState(Buffer(), 6, outcomes);
  EXPECT_TRUE(v.consistent);
  EXPECT_FALSE(v.invariant_held);
  EXPECT_TRUE(v.race_detected);
}

TEST(VerificationTest, BufferLostUpdateIsInconsistent) {
  std::vector<WorkerOutcome> outcomes = {Completed("p1", 2, 2, 1),
                                         Consumed("c1", 1, 1)};
  // Both produced units landed but the consumer wrote back a stale count.
  Verification v = VerifyFinalState(Buffer(), 0, outcomes);
  EXPECT_EQ(1, v.expected);
  EXPECT_TRUE(v.invariant_held);
  EXPECT_FALSE(v.consistent);
  EXPECT_TRUE(v.race_detected);
}

}  // namespace test
}  // namespace harness
}  // namespace racelab

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
