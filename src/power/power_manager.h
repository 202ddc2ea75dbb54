// src/power/power_manager.h
// Role: Sleep scheduling between cycles and timer-only low-power entry.
//
// next_wake_delay():
// - success/neutral outcomes: the configured sample interval; failure streak resets
// - radio failures (join failed, fault, not ready, ack/tx timeout): interval + backoff(streak),
//   capped at the sleep ceiling but never below the interval
#pragma once

#include <stdint.h>

class EsnBackoff;
class EsnEventLogger;
class EsnSleepDriver;

enum class EsnCycleOutcome : uint8_t {
  TRANSMITTED = 0,
  ACK_TIMEOUT,
  TX_TIMEOUT,
  NO_DATA,            // zero valid readings
  ENCODE_OVERFLOW,    // still too large after dropping channels
  JOIN_FAILED,
  RADIO_FAULT,
  STORAGE_FAILED,     // counter could not be persisted
  SESSION_EXPIRED,    // rejoin needed before the next uplink
  RADIO_NOT_READY,    // controller not joined when the uplink was due
  DEADLINE_EXCEEDED,  // ran out of time while sampling
};

const char* esn_cycle_outcome_name(EsnCycleOutcome o);

// True for outcomes that escalate the sleep backoff.
bool esn_outcome_is_radio_failure(EsnCycleOutcome o);

struct EsnPowerConfig {
  uint32_t sample_interval_s = 300;
  uint32_t sleep_ceiling_s = 3600;
};

class EsnPowerManager {
 public:
  void begin(const EsnPowerConfig& cfg, EsnBackoff* backoff, EsnSleepDriver* driver, EsnEventLogger* log);

  uint32_t next_wake_delay(EsnCycleOutcome last_outcome);

  // Lowest RAM-preserving power state for `ms`, woken by timer.
  void sleep(uint32_t ms);
  // Short timer wait inside a cycle (join retry slots).
  void nap(uint32_t ms);

  uint32_t consecutive_failures() const { return _failures; }
  uint32_t total_sleep_ms() const { return _slept_ms; }

 private:
  EsnPowerConfig _cfg;
  EsnBackoff* _backoff = nullptr;
  EsnSleepDriver* _driver = nullptr;
  EsnEventLogger* _log = nullptr;
  uint32_t _failures = 0;
  uint32_t _slept_ms = 0;
};
