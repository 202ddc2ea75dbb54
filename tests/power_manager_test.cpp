// tests/power_manager_test.cpp

#include <gtest/gtest.h>

#include "fakes.h"
#include "logging/event_logger.h"
#include "power/power_manager.h"
#include "radio/backoff.h"

namespace {

class PowerManagerTest : public ::testing::Test {
 protected:
  PowerManagerTest() : sleeper(&clock) {}

  void SetUp() override {
    logger.begin(&clock, &sink);
    logger.set_min_severity(EsnLogSeverity::DEBUG);
    backoff.begin(EsnBackoffConfig(), &entropy);  // entropy yields 0: no jitter
    power.begin(EsnPowerConfig(), &backoff, &sleeper, &logger);
  }

  FakeClock clock;
  FakeSleepDriver sleeper;
  SequenceEntropy entropy;
  CaptureLogSink sink;
  EsnEventLogger logger;
  EsnBackoff backoff;
  EsnPowerManager power;
};

TEST_F(PowerManagerTest, SuccessSleepsForTheInterval) {
  EXPECT_EQ(300000u, power.next_wake_delay(EsnCycleOutcome::TRANSMITTED));
  EXPECT_EQ(300000u, power.next_wake_delay(EsnCycleOutcome::NO_DATA));
  EXPECT_EQ(300000u, power.next_wake_delay(EsnCycleOutcome::ENCODE_OVERFLOW));
  EXPECT_EQ(0u, power.consecutive_failures());
}

TEST_F(PowerManagerTest, RadioFailuresExtendSleep) {
  EXPECT_EQ(315000u, power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED));
  EXPECT_EQ(330000u, power.next_wake_delay(EsnCycleOutcome::RADIO_FAULT));
  EXPECT_EQ(360000u, power.next_wake_delay(EsnCycleOutcome::ACK_TIMEOUT));
  EXPECT_EQ(420000u, power.next_wake_delay(EsnCycleOutcome::TX_TIMEOUT));
  EXPECT_EQ(4u, power.consecutive_failures());
  EXPECT_EQ(4u, sink.count("sleep_backoff"));
}

TEST_F(PowerManagerTest, SuccessResetsTheStreak) {
  power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED);
  power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED);
  EXPECT_EQ(300000u, power.next_wake_delay(EsnCycleOutcome::TRANSMITTED));
  EXPECT_EQ(315000u, power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED));
}

TEST_F(PowerManagerTest, CeilingBoundsTheSleep) {
  EsnPowerConfig cfg;
  cfg.sleep_ceiling_s = 400;
  power.begin(cfg, &backoff, &sleeper, &logger);
  uint32_t last = 0;
  for (int i = 0; i < 20; ++i) last = power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED);
  EXPECT_EQ(400000u, last);
}

TEST_F(PowerManagerTest, FailureNeverSleepsLessThanSuccess) {
  EsnPowerConfig cfg;
  cfg.sample_interval_s = 900;
  cfg.sleep_ceiling_s = 600;
  power.begin(cfg, &backoff, &sleeper, &logger);
  const uint32_t ok = power.next_wake_delay(EsnCycleOutcome::TRANSMITTED);
  EXPECT_EQ(900000u, ok);
  for (int i = 0; i < 5; ++i) {
    EXPECT_GE(power.next_wake_delay(EsnCycleOutcome::JOIN_FAILED), ok) << "failure " << i;
  }
  EXPECT_EQ(900000u, power.next_wake_delay(EsnCycleOutcome::TX_TIMEOUT));
}

TEST_F(PowerManagerTest, SleepDrivesTheTimer) {
  power.sleep(1234);
  power.nap(66);
  power.sleep(0);
  ASSERT_EQ(2u, sleeper.requests.size());
  EXPECT_EQ(1234u, sleeper.requests[0]);
  EXPECT_EQ(66u, sleeper.requests[1]);
  EXPECT_EQ(1300u, clock.peek());
  EXPECT_EQ(1300u, power.total_sleep_ms());
}

TEST(CycleOutcome, RadioFailureClassification) {
  EXPECT_TRUE(esn_outcome_is_radio_failure(EsnCycleOutcome::JOIN_FAILED));
  EXPECT_TRUE(esn_outcome_is_radio_failure(EsnCycleOutcome::RADIO_FAULT));
  EXPECT_TRUE(esn_outcome_is_radio_failure(EsnCycleOutcome::ACK_TIMEOUT));
  EXPECT_TRUE(esn_outcome_is_radio_failure(EsnCycleOutcome::TX_TIMEOUT));
  EXPECT_TRUE(esn_outcome_is_radio_failure(EsnCycleOutcome::RADIO_NOT_READY));
  EXPECT_FALSE(esn_outcome_is_radio_failure(EsnCycleOutcome::TRANSMITTED));
  EXPECT_FALSE(esn_outcome_is_radio_failure(EsnCycleOutcome::STORAGE_FAILED));
  EXPECT_FALSE(esn_outcome_is_radio_failure(EsnCycleOutcome::DEADLINE_EXCEEDED));
  EXPECT_STREQ("join_failed", esn_cycle_outcome_name(EsnCycleOutcome::JOIN_FAILED));
  EXPECT_STREQ("radio_not_ready", esn_cycle_outcome_name(EsnCycleOutcome::RADIO_NOT_READY));
}

}  // namespace
