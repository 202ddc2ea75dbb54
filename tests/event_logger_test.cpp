// tests/event_logger_test.cpp

#include <gtest/gtest.h>

#include <ArduinoJson.h>

#include <string>

#include "fakes.h"
#include "logging/event_logger.h"

namespace {

class EventLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { logger.begin(&clock, &sink); }

  FakeClock clock;
  CaptureLogSink sink;
  EsnEventLogger logger;
};

TEST_F(EventLoggerTest, WritesOneJsonObjectPerLine) {
  clock.set(5021);
  logger.log_info("radio", "join_success", "joined network");
  ASSERT_EQ(1u, sink.lines.size());

  StaticJsonDocument<1024> d;
  ASSERT_FALSE(deserializeJson(d, sink.lines[0]));
  EXPECT_EQ(1, d["v"].as<int>());
  EXPECT_EQ(1u, d["seq"].as<uint32_t>());
  EXPECT_EQ(5021u, d["uptime_ms"].as<uint32_t>());
  EXPECT_STREQ("info", d["severity"].as<const char*>());
  EXPECT_STREQ("radio", d["source"].as<const char*>());
  EXPECT_STREQ("join_success", d["event_type"].as<const char*>());
  EXPECT_STREQ("joined network", d["msg"].as<const char*>());
}

TEST_F(EventLoggerTest, SequenceIsMonotonic) {
  logger.log_info("a", "one", "");
  logger.log_warn("a", "two", "");
  logger.log_error("a", "three", "");
  EXPECT_EQ(3u, logger.last_seq());
  StaticJsonDocument<1024> d;
  ASSERT_FALSE(deserializeJson(d, sink.lines[2]));
  EXPECT_EQ(3u, d["seq"].as<uint32_t>());
  EXPECT_STREQ("error", d["severity"].as<const char*>());
}

TEST_F(EventLoggerTest, EventsBelowMinimumSeverityAreDropped) {
  logger.log_debug("cycle", "phase_transition", "phase transition");
  EXPECT_TRUE(sink.lines.empty());
  EXPECT_EQ(0u, logger.last_seq());

  logger.set_min_severity(EsnLogSeverity::DEBUG);
  logger.log_debug("cycle", "phase_transition", "phase transition");
  EXPECT_EQ(1u, sink.lines.size());

  logger.set_min_severity(EsnLogSeverity::ERROR);
  logger.log_warn("cycle", "cycle_complete", "");
  EXPECT_EQ(1u, sink.lines.size());
}

TEST_F(EventLoggerTest, ExtraFieldsAreCopied) {
  StaticJsonDocument<128> extra;
  extra["from"] = "JOINED";
  extra["to"] = "TRANSMITTING";
  extra["fcnt_up"] = 42;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  logger.log_info("radio", "state_transition", "state transition", &o);
  EXPECT_EQ(1u, sink.transitions("JOINED", "TRANSMITTING"));

  StaticJsonDocument<1024> d;
  ASSERT_FALSE(deserializeJson(d, sink.lines[0]));
  EXPECT_EQ(42, d["fcnt_up"].as<int>());
}

TEST_F(EventLoggerTest, WideExtrasAreAllWritten) {
  StaticJsonDocument<1024> extra;
  const char* names[] = {"cycle", "outcome", "readings", "valid_readings", "payload_entries", "payload_bytes",
                         "transmitted", "fcnt_up", "storage_error", "duration_ms", "sleep_ms"};
  for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) extra[names[i]] = (uint32_t)(i + 1);
  JsonArray dropped = extra.createNestedArray("dropped");
  dropped.add("battery");
  dropped.add("soil_temperature");
  dropped.add("air_humidity");
  JsonObjectConst o = extra.as<JsonObjectConst>();
  logger.log_warn("cycle", "cycle_complete", "cycle complete with failure", &o);

  DynamicJsonDocument d(4096);
  ASSERT_FALSE(deserializeJson(d, sink.lines[0]));
  EXPECT_FALSE(d.containsKey("extra_truncated"));
  EXPECT_EQ(11u, d["sleep_ms"].as<uint32_t>());
  EXPECT_EQ(3u, d["dropped"].size());
}

TEST_F(EventLoggerTest, OversizedExtrasAreFlaggedNotLost) {
  DynamicJsonDocument extra(8192);
  for (int i = 0; i < 40; ++i) {
    std::string key = "field_" + std::to_string(i);
    extra[key] = std::string(40, 'x');
  }
  JsonObjectConst o = extra.as<JsonObjectConst>();
  logger.log_info("test", "wide_event", "too many extras", &o);

  ASSERT_EQ(1u, sink.lines.size());
  DynamicJsonDocument d(4096);
  ASSERT_FALSE(deserializeJson(d, sink.lines[0]));
  EXPECT_TRUE(d["extra_truncated"].as<bool>());
  EXPECT_STREQ("wide_event", d["event_type"].as<const char*>());
  EXPECT_EQ(1u, d["seq"].as<uint32_t>());
  EXPECT_FALSE(d.containsKey("field_0"));
}

TEST_F(EventLoggerTest, RingKeepsTheMostRecentEvents) {
  for (int i = 0; i < 45; ++i) logger.log_info("t", "tick", "");
  EXPECT_EQ(40u, logger.event_count());

  DynamicJsonDocument all(32768);
  logger.recent_events(all, 0);
  ASSERT_EQ(40u, all.size());
  EXPECT_EQ(6u, all[0]["seq"].as<uint32_t>());
  EXPECT_EQ(45u, all[39]["seq"].as<uint32_t>());

  DynamicJsonDocument last(4096);
  logger.recent_events(last, 3);
  ASSERT_EQ(3u, last.size());
  EXPECT_EQ(43u, last[0]["seq"].as<uint32_t>());
  EXPECT_EQ(45u, last[2]["seq"].as<uint32_t>());
}

TEST_F(EventLoggerTest, ConfigChangeCarriesKeyNamesOnly) {
  StaticJsonDocument<128> keys;
  JsonArray arr = keys.to<JsonArray>();
  arr.add("app_key");
  arr.add("sample_interval_s");
  logger.log_config_change("config", arr);

  StaticJsonDocument<1024> d;
  ASSERT_FALSE(deserializeJson(d, sink.nth("config_change", 0)));
  ASSERT_EQ(2u, d["keys"].size());
  EXPECT_STREQ("app_key", d["keys"][0].as<const char*>());
  EXPECT_STREQ("info", d["severity"].as<const char*>());
}

TEST_F(EventLoggerTest, WorksWithoutSinkOrClock) {
  EsnEventLogger bare;
  bare.begin(nullptr, nullptr);
  bare.log_warn("x", "y", "z");
  EXPECT_EQ(1u, bare.event_count());
  DynamicJsonDocument out(1024);
  bare.recent_events(out, 10);
  ASSERT_EQ(1u, out.size());
  EXPECT_EQ(0u, out[0]["uptime_ms"].as<uint32_t>());
}

TEST(Severity, NamesRoundTrip) {
  EsnLogSeverity s = EsnLogSeverity::INFO;
  EXPECT_TRUE(esn_parse_severity("warn", s));
  EXPECT_EQ(EsnLogSeverity::WARN, s);
  EXPECT_STREQ("warn", esn_severity_name(s));
  EXPECT_FALSE(esn_parse_severity("WARN", s));
  EXPECT_FALSE(esn_parse_severity("verbose", s));
  EXPECT_EQ(EsnLogSeverity::WARN, s);
}

}  // namespace
