// src/power/power_manager.cpp
// Role: Sleep scheduling between cycles and timer-only low-power entry.

#include "power_manager.h"

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../platform/hal.h"
#include "../radio/backoff.h"

const char* esn_cycle_outcome_name(EsnCycleOutcome o) {
  switch (o) {
    case EsnCycleOutcome::TRANSMITTED: return "transmitted";
    case EsnCycleOutcome::ACK_TIMEOUT: return "ack_timeout";
    case EsnCycleOutcome::TX_TIMEOUT: return "tx_timeout";
    case EsnCycleOutcome::NO_DATA: return "no_data";
    case EsnCycleOutcome::ENCODE_OVERFLOW: return "encode_overflow";
    case EsnCycleOutcome::JOIN_FAILED: return "join_failed";
    case EsnCycleOutcome::RADIO_FAULT: return "radio_fault";
    case EsnCycleOutcome::STORAGE_FAILED: return "storage_failed";
    case EsnCycleOutcome::SESSION_EXPIRED: return "session_expired";
    case EsnCycleOutcome::RADIO_NOT_READY: return "radio_not_ready";
    case EsnCycleOutcome::DEADLINE_EXCEEDED: return "deadline_exceeded";
  }
  return "unknown";
}

bool esn_outcome_is_radio_failure(EsnCycleOutcome o) {
  return o == EsnCycleOutcome::JOIN_FAILED || o == EsnCycleOutcome::RADIO_FAULT ||
         o == EsnCycleOutcome::RADIO_NOT_READY || o == EsnCycleOutcome::ACK_TIMEOUT ||
         o == EsnCycleOutcome::TX_TIMEOUT;
}

void EsnPowerManager::begin(const EsnPowerConfig& cfg, EsnBackoff* backoff, EsnSleepDriver* driver,
                            EsnEventLogger* log) {
  _cfg = cfg;
  _backoff = backoff;
  _driver = driver;
  _log = log;
  _failures = 0;
  _slept_ms = 0;
}

uint32_t EsnPowerManager::next_wake_delay(EsnCycleOutcome last_outcome) {
  const uint64_t interval_ms = (uint64_t)_cfg.sample_interval_s * 1000ULL;
  if (!esn_outcome_is_radio_failure(last_outcome)) {
    _failures = 0;
    return interval_ms > 0xFFFFFFFFULL ? 0xFFFFFFFFUL : (uint32_t)interval_ms;
  }

  _failures++;
  uint64_t delay = interval_ms + (_backoff ? _backoff->delay_ms(_failures) : 0);
  uint64_t ceiling = (uint64_t)_cfg.sleep_ceiling_s * 1000ULL;
  // A failed cycle never sleeps less than a successful one.
  if (ceiling < interval_ms) ceiling = interval_ms;
  if (delay > ceiling) delay = ceiling;
  if (delay > 0xFFFFFFFFULL) delay = 0xFFFFFFFFULL;

  if (_log) {
    StaticJsonDocument<160> extra;
    extra["outcome"] = esn_cycle_outcome_name(last_outcome);
    extra["consecutive_failures"] = _failures;
    extra["delay_ms"] = (uint32_t)delay;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_info("power", "sleep_backoff", "sleep extended after radio failure", &o);
  }
  return (uint32_t)delay;
}

void EsnPowerManager::sleep(uint32_t ms) {
  if (_log) {
    StaticJsonDocument<64> extra;
    extra["sleep_ms"] = ms;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_debug("power", "sleep_enter", "entering low power", &o);
  }
  if (_driver && ms > 0) _driver->sleep_ms(ms);
  _slept_ms += ms;
}

void EsnPowerManager::nap(uint32_t ms) {
  if (_driver && ms > 0) _driver->sleep_ms(ms);
  _slept_ms += ms;
}
