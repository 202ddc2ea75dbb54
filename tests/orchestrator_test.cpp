// tests/orchestrator_test.cpp
// Whole-node cycles over fake hardware: sensors, radio, storage and sleep.

#include <gtest/gtest.h>

#include <ArduinoJson.h>

#include <string.h>

#include <vector>

#include "fakes.h"
#include "logging/event_logger.h"
#include "orchestrator/orchestrator.h"
#include "payload/payload_encoder.h"
#include "power/power_manager.h"
#include "radio/backoff.h"
#include "radio/radio_controller.h"
#include "sensors/sensor_manager.h"
#include "storage/session_store.h"

namespace {

FakeSensor single(EsnSensorKind kind, const char* id, EsnChannel c, float v) {
  return FakeSensor(kind, id, std::vector<EsnChannel>{c}, std::vector<float>{v});
}

class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest()
      : sleeper(&clock),
        air_temp(single(EsnSensorKind::AIR, "air_temp", EsnChannel::AIR_TEMPERATURE, 22.5f)),
        air_hum(single(EsnSensorKind::AIR, "air_hum", EsnChannel::AIR_HUMIDITY, 48.0f)),
        co2(single(EsnSensorKind::AIR, "co2", EsnChannel::CO2, 640.0f)),
        soil_temp(single(EsnSensorKind::SOIL, "soil_temp", EsnChannel::SOIL_TEMPERATURE, 14.0f)),
        soil_moist(single(EsnSensorKind::SOIL, "soil_moist", EsnChannel::SOIL_MOISTURE, 700.0f)),
        battery(single(EsnSensorKind::SYSTEM, "battery", EsnChannel::BATTERY, 3.9f)) {}

  void SetUp() override {
    logger.begin(&clock, &sink);
    logger.set_min_severity(EsnLogSeverity::DEBUG);
    store.begin(&kv, &logger);
  }

  void store_session(uint32_t fcnt_up) {
    EsnStorageError err = EsnStorageError::NONE;
    ASSERT_TRUE(store.save(make_test_session(fcnt_up), err));
  }

  void boot() {
    sensors.add_sensor(&air_temp);
    sensors.add_sensor(&air_hum);
    sensors.add_sensor(&co2);
    sensors.add_sensor(&soil_temp);
    sensors.add_sensor(&soil_moist);
    if (with_battery) sensors.add_sensor(&battery);
    sensors.begin(EsnSensorManagerConfig(), &clock, &logger);

    encoder = EsnPayloadEncoder(max_payload_bytes);
    backoff.begin(EsnBackoffConfig(), &entropy);
    radio_ok = ctl.begin(radio_cfg, make_test_credentials(), &radio, &store, &backoff, &clock, &logger);
    power.begin(EsnPowerConfig(), &backoff, &sleeper, &logger);
    orchestrator.begin(cfg, &sensors, &encoder, &ctl, &power, &clock, &logger);
  }

  bool stored(EsnSession& out) {
    EsnSessionStore reader;
    reader.begin(&kv, nullptr);
    EsnStorageError err = EsnStorageError::NONE;
    return reader.load(out, err);
  }

  FakeClock clock;
  CaptureLogSink sink;
  EsnEventLogger logger;
  MemoryKvStore kv;
  EsnSessionStore store;
  SequenceEntropy entropy;  // empty: zero jitter
  FakeSleepDriver sleeper;
  FakeRadio radio;

  FakeSensor air_temp;
  FakeSensor air_hum;
  FakeSensor co2;
  FakeSensor soil_temp;
  FakeSensor soil_moist;
  FakeSensor battery;
  bool with_battery = false;

  size_t max_payload_bytes = 51;
  EsnRadioControllerConfig radio_cfg;
  EsnOrchestratorConfig cfg;

  EsnSensorManager sensors;
  EsnPayloadEncoder encoder;
  EsnBackoff backoff;
  EsnRadioController ctl;
  bool radio_ok = false;
  EsnPowerManager power;
  EsnOrchestrator orchestrator;
};

TEST_F(OrchestratorTest, JoinedNodeTransmitsAllChannels) {
  store_session(41);
  boot();
  uint32_t persisted_at_start = 0;
  radio.on_start_uplink = [this, &persisted_at_start](uint32_t) {
    EsnSession s;
    if (stored(s)) persisted_at_start = s.fcnt_up;
  };

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, r.outcome);
  EXPECT_TRUE(r.transmitted);
  EXPECT_EQ(5u, r.payload_entries);
  EXPECT_EQ(19u, r.payload_bytes);
  EXPECT_EQ(41u, r.fcnt_used);
  EXPECT_EQ(300000u, r.sleep_ms);

  ASSERT_EQ(1u, radio.uplinks.size());
  EXPECT_EQ(41u, radio.uplinks[0].fcnt);
  EXPECT_EQ(19u, radio.uplinks[0].bytes.size());
  EXPECT_EQ(42u, persisted_at_start);
  EXPECT_EQ(1u, sink.transitions("TRANSMITTING", "JOINED"));

  EsnSession s;
  ASSERT_TRUE(stored(s));
  EXPECT_EQ(42u, s.fcnt_up);
  EXPECT_EQ(300000u, sleeper.requests.back());
  EXPECT_EQ(EsnCyclePhase::IDLE, orchestrator.phase());
  EXPECT_EQ(1u, orchestrator.cycles_completed());
  EXPECT_EQ(0u, radio.join_starts);
}

TEST_F(OrchestratorTest, FailedSensorIsLeftOutOfThePayload) {
  store_session(7);
  co2.error = EsnSensorError::BUS_TIMEOUT;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, r.outcome);
  EXPECT_EQ(5u, r.readings);
  EXPECT_EQ(4u, r.valid_readings);
  EXPECT_EQ(4u, r.payload_entries);
  ASSERT_EQ(1u, radio.uplinks.size());
  const std::vector<uint8_t>& b = radio.uplinks[0].bytes;
  ASSERT_EQ(15u, b.size());
  // Entries: air temp (4), humidity (3), soil temp (4), soil moisture (4).
  EXPECT_EQ(0x01, b[0]);
  EXPECT_EQ(0x02, b[4]);
  EXPECT_EQ(0x04, b[7]);
  EXPECT_EQ(0x05, b[11]);
}

TEST_F(OrchestratorTest, FirstCycleWithoutSessionJoinsThenTransmits) {
  radio.join_results.push_back(EsnRadioStatus::OK);
  boot();
  ASSERT_EQ(EsnRadioState::IDLE, ctl.state());

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, r.outcome);
  EXPECT_EQ(1u, sink.transitions("IDLE", "JOINING"));
  EXPECT_EQ(1u, sink.transitions("JOINING", "JOINED"));
  EXPECT_EQ(1u, sink.transitions("JOINED", "TRANSMITTING"));
  ASSERT_EQ(1u, radio.uplinks.size());
  EXPECT_EQ(0u, radio.uplinks[0].fcnt);

  EsnSession s;
  ASSERT_TRUE(stored(s));
  EXPECT_TRUE(s.joined);
  EXPECT_EQ(radio.join_session.dev_addr, s.dev_addr);
  EXPECT_EQ(1u, s.fcnt_up);
}

TEST_F(OrchestratorTest, RepeatedJoinFailuresLengthenSleep) {
  for (int i = 0; i < 9; ++i) radio.join_results.push_back(EsnRadioStatus::NO_JOIN_ACCEPT);
  boot();

  std::vector<uint32_t> delays;
  for (int i = 0; i < 3; ++i) {
    const EsnCycleReport& r = orchestrator.run_cycle();
    EXPECT_EQ(EsnCycleOutcome::JOIN_FAILED, r.outcome);
    EXPECT_FALSE(r.transmitted);
    delays.push_back(r.sleep_ms);
  }
  ASSERT_EQ(3u, delays.size());
  EXPECT_EQ(315000u, delays[0]);
  EXPECT_EQ(330000u, delays[1]);
  EXPECT_EQ(360000u, delays[2]);
  EXPECT_EQ(9u, radio.join_starts);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_EQ(3u, power.consecutive_failures());
}

TEST_F(OrchestratorTest, CorruptSessionRecordForcesJoin) {
  uint8_t junk[EsnSessionStore::kRecordBytes];
  memset(junk, 0xC3, sizeof(junk));
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(kv.put(EsnSessionStore::kRecordKey, junk, sizeof(junk), err));
  radio.join_results.push_back(EsnRadioStatus::OK);
  boot();

  EXPECT_TRUE(radio_ok);
  EXPECT_EQ(EsnStorageError::CORRUPT, ctl.last_load_error());
  EXPECT_EQ(EsnRadioState::IDLE, ctl.state());
  EXPECT_TRUE(sink.has("session_corrupt"));

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, r.outcome);
  EXPECT_EQ(1u, radio.join_starts);
}

TEST_F(OrchestratorTest, OverflowDropsLowPriorityChannels) {
  store_session(2);
  with_battery = true;
  max_payload_bytes = 12;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, r.outcome);
  EXPECT_EQ(3u, r.payload_entries);
  EXPECT_EQ(12u, r.payload_bytes);
  ASSERT_EQ(3u, r.dropped.size());
  EXPECT_EQ(EsnChannel::BATTERY, r.dropped[0]);
  EXPECT_EQ(EsnChannel::SOIL_TEMPERATURE, r.dropped[1]);
  EXPECT_EQ(EsnChannel::AIR_HUMIDITY, r.dropped[2]);
  EXPECT_TRUE(sink.has("payload_overflow"));
  EXPECT_TRUE(sink.has("payload_channels_dropped"));
}

TEST_F(OrchestratorTest, OverflowThatCannotBeResolvedAbortsTheCycle) {
  store_session(2);
  with_battery = true;
  max_payload_bytes = 10;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::ENCODE_OVERFLOW, r.outcome);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_TRUE(sink.has("payload_overflow_abort"));
  EXPECT_EQ(300000u, r.sleep_ms);
  EsnSession s;
  ASSERT_TRUE(stored(s));
  EXPECT_EQ(2u, s.fcnt_up);
}

TEST_F(OrchestratorTest, NoValidReadingsSkipsTransmit) {
  store_session(5);
  air_temp.error = EsnSensorError::BUS_TIMEOUT;
  air_hum.error = EsnSensorError::BUS_TIMEOUT;
  co2.present = false;
  soil_temp.present = false;
  soil_moist.present = false;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::NO_DATA, r.outcome);
  EXPECT_EQ(0u, r.valid_readings);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_EQ(300000u, r.sleep_ms);
  EXPECT_TRUE(sink.has("no_valid_readings"));

  // The schedule keeps going.
  co2.error = EsnSensorError::NONE;
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, orchestrator.run_cycle().outcome);
  EXPECT_EQ(2u, orchestrator.cycles_completed());
}

TEST_F(OrchestratorTest, CycleDeadlineDuringJoinCountsAsJoinFailure) {
  radio_cfg.join_timeout_ms = 600000;
  radio.clock = &clock;
  radio.poll_cost_ms = 1000;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::JOIN_FAILED, r.outcome);
  EXPECT_GE(r.duration_ms, cfg.cycle_deadline_ms);
  EXPECT_EQ(1u, radio.aborts);
  EXPECT_FALSE(radio.busy());
  EXPECT_EQ(EsnRadioState::IDLE, ctl.state());
  EXPECT_TRUE(sink.has("cycle_deadline_exceeded"));
  EXPECT_EQ(315000u, r.sleep_ms);

  // A network that never answers keeps pushing the next wake out.
  const EsnCycleReport& second = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::JOIN_FAILED, second.outcome);
  EXPECT_EQ(330000u, second.sleep_ms);
  EXPECT_EQ(2u, power.consecutive_failures());
}

TEST_F(OrchestratorTest, CycleDeadlineDuringUplinkCountsAsTransmitTimeout) {
  store_session(12);
  radio_cfg.uplink_timeout_ms = 600000;
  radio.clock = &clock;
  radio.poll_cost_ms = 1000;
  radio.uplink_busy_polls = 100000;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TX_TIMEOUT, r.outcome);
  EXPECT_FALSE(r.transmitted);
  EXPECT_EQ(12u, r.fcnt_used);
  EXPECT_EQ(315000u, r.sleep_ms);
  EXPECT_EQ(1u, radio.reset_calls);
  EXPECT_EQ(EsnRadioState::JOINED, ctl.state());

  // The consumed counter stays consumed.
  EsnSession s;
  ASSERT_TRUE(stored(s));
  EXPECT_EQ(13u, s.fcnt_up);
}

TEST_F(OrchestratorTest, DeadlineWhileSamplingDoesNotEscalate) {
  store_session(1);
  air_temp.clock = &clock;
  air_temp.sample_cost_ms = 130000;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::DEADLINE_EXCEEDED, r.outcome);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_EQ(300000u, r.sleep_ms);
  EXPECT_EQ(0u, power.consecutive_failures());
}

TEST_F(OrchestratorTest, DroppingEveryReadingEndsAsNoData) {
  with_battery = true;
  max_payload_bytes = 3;
  air_temp.present = false;
  air_hum.present = false;
  co2.present = false;
  soil_temp.present = false;
  soil_moist.present = false;
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::NO_DATA, r.outcome);
  EXPECT_EQ(1u, r.valid_readings);
  ASSERT_EQ(1u, r.dropped.size());
  EXPECT_EQ(EsnChannel::BATTERY, r.dropped[0]);
  EXPECT_EQ(0u, r.payload_entries);
  EXPECT_EQ(0u, radio.join_starts);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_EQ(300000u, r.sleep_ms);
  EXPECT_TRUE(sink.has("no_valid_readings"));
}

TEST_F(OrchestratorTest, CycleReportLogKeepsEveryField) {
  store_session(2);
  with_battery = true;
  max_payload_bytes = 12;
  boot();

  orchestrator.run_cycle();
  StaticJsonDocument<2048> d;
  ASSERT_FALSE(deserializeJson(d, sink.nth("cycle_complete", 0)));
  EXPECT_FALSE(d.containsKey("extra_truncated"));
  EXPECT_STREQ("transmitted", d["outcome"].as<const char*>());
  EXPECT_EQ(3u, d["dropped"].size());
  EXPECT_EQ(2u, d["fcnt_up"].as<uint32_t>());
  EXPECT_EQ(300000u, d["sleep_ms"].as<uint32_t>());
  EXPECT_TRUE(d.containsKey("duration_ms"));
}

TEST_F(OrchestratorTest, CounterPersistFailureAbortsBeforeTransmit) {
  store_session(9);
  boot();
  kv.fail_writes = true;

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::STORAGE_FAILED, r.outcome);
  EXPECT_EQ(EsnStorageError::WRITE_FAILED, r.storage_error);
  EXPECT_TRUE(radio.uplinks.empty());
  EXPECT_FALSE(r.transmitted);
}

TEST_F(OrchestratorTest, FaultedRadioIsResetOnTheNextCycle) {
  store_session(3);
  radio.uplink_results.push_back(EsnRadioStatus::HARDWARE_FAULT);
  boot();

  const EsnCycleReport& first = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::RADIO_FAULT, first.outcome);
  EXPECT_EQ(315000u, first.sleep_ms);
  EXPECT_EQ(EsnRadioState::FAULTED, ctl.state());

  const EsnCycleReport& second = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, second.outcome);
  EXPECT_EQ(1u, radio.reset_calls);
  ASSERT_EQ(2u, radio.uplinks.size());
  EXPECT_EQ(4u, radio.uplinks[1].fcnt);
  EXPECT_EQ(300000u, second.sleep_ms);
}

TEST_F(OrchestratorTest, SessionAtThresholdRejoinsOncePerCycle) {
  radio_cfg.fcnt_rejoin_threshold = 100;
  radio.join_session = make_test_session(200);
  radio.join_results.push_back(EsnRadioStatus::OK);
  radio.join_results.push_back(EsnRadioStatus::OK);
  boot();

  const EsnCycleReport& r = orchestrator.run_cycle();
  EXPECT_EQ(EsnCycleOutcome::SESSION_EXPIRED, r.outcome);
  EXPECT_EQ(2u, radio.join_starts);
  EXPECT_TRUE(radio.uplinks.empty());
}

TEST_F(OrchestratorTest, ThresholdReachedOnSendRejoinsNextCycle) {
  radio_cfg.fcnt_rejoin_threshold = 101;
  store_session(100);
  radio.join_results.push_back(EsnRadioStatus::OK);
  boot();

  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, orchestrator.run_cycle().outcome);
  EXPECT_FALSE(ctl.has_session());
  EXPECT_EQ(0u, radio.join_starts);

  EXPECT_EQ(EsnCycleOutcome::TRANSMITTED, orchestrator.run_cycle().outcome);
  EXPECT_EQ(1u, radio.join_starts);
  ASSERT_EQ(2u, radio.uplinks.size());
  EXPECT_EQ(100u, radio.uplinks[0].fcnt);
  EXPECT_EQ(0u, radio.uplinks[1].fcnt);
}

TEST_F(OrchestratorTest, LoopAdvancesOnePhasePerCall) {
  store_session(1);
  boot();
  EXPECT_EQ(EsnCyclePhase::IDLE, orchestrator.phase());
  orchestrator.loop();
  EXPECT_EQ(EsnCyclePhase::SAMPLING, orchestrator.phase());
  for (int i = 0; i < 5; ++i) orchestrator.loop();
  EXPECT_EQ(EsnCyclePhase::ENCODING, orchestrator.phase());
  orchestrator.loop();
  EXPECT_EQ(EsnCyclePhase::JOINING, orchestrator.phase());
  orchestrator.loop();
  EXPECT_EQ(EsnCyclePhase::TRANSMITTING, orchestrator.phase());
  EXPECT_EQ(0u, orchestrator.cycles_completed());
}

}  // namespace
