// src/orchestrator/orchestrator.cpp
// Role: Cycle sequencing + per-stage failure policy.

#include "orchestrator.h"

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../platform/hal.h"
#include "../radio/radio_controller.h"
#include "../sensors/sensor_manager.h"

// cycle_complete extras: up to 13 members plus one array entry per droppable channel.
static const size_t kCycleExtraBytes = JSON_OBJECT_SIZE(13) + JSON_ARRAY_SIZE(kEsnChannelCount);

const char* esn_cycle_phase_name(EsnCyclePhase p) {
  switch (p) {
    case EsnCyclePhase::IDLE: return "IDLE";
    case EsnCyclePhase::SAMPLING: return "SAMPLING";
    case EsnCyclePhase::ENCODING: return "ENCODING";
    case EsnCyclePhase::JOINING: return "JOINING";
    case EsnCyclePhase::TRANSMITTING: return "TRANSMITTING";
    case EsnCyclePhase::SLEEPING: return "SLEEPING";
  }
  return "IDLE";
}

void EsnOrchestrator::begin(const EsnOrchestratorConfig& cfg, EsnSensorManager* sensors,
                            EsnPayloadEncoder* encoder, EsnRadioController* radio, EsnPowerManager* power,
                            EsnClock* clock, EsnEventLogger* log) {
  _cfg = cfg;
  _sensors = sensors;
  _encoder = encoder;
  _radio = radio;
  _power = power;
  _clock = clock;
  _log = log;
  _phase = EsnCyclePhase::IDLE;
  _cycles_started = 0;
  _cycles_done = 0;
}

void EsnOrchestrator::set_phase(EsnCyclePhase next) {
  if (next == _phase) return;
  if (_log) {
    StaticJsonDocument<128> extra;
    extra["cycle"] = _current.cycle;
    extra["from"] = esn_cycle_phase_name(_phase);
    extra["to"] = esn_cycle_phase_name(next);
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_debug("cycle", "phase_transition", "phase transition", &o);
  }
  _phase = next;
}

void EsnOrchestrator::loop() {
  switch (_phase) {
    case EsnCyclePhase::IDLE: start_cycle(); break;
    case EsnCyclePhase::SAMPLING: step_sampling(); break;
    case EsnCyclePhase::ENCODING: step_encoding(); break;
    case EsnCyclePhase::JOINING: step_joining(); break;
    case EsnCyclePhase::TRANSMITTING: step_transmitting(); break;
    case EsnCyclePhase::SLEEPING: step_sleeping(); break;
  }
}

const EsnCycleReport& EsnOrchestrator::run_cycle() {
  if (_phase == EsnCyclePhase::IDLE) loop();
  while (_phase != EsnCyclePhase::IDLE) loop();
  return _last;
}

bool EsnOrchestrator::deadline_passed() {
  return esn_time_reached(_clock->now_ms(), _deadline_ms);
}

void EsnOrchestrator::start_cycle() {
  _cycles_started++;
  _current = EsnCycleReport();
  _current.cycle = _cycles_started;
  _cycle_start_ms = _clock->now_ms();
  _deadline_ms = _cycle_start_ms + _cfg.cycle_deadline_ms;
  _uplink_started = false;
  _rejoined = false;
  _payload = EsnPayload();

  _radio->wake();
  _radio->begin_wake();
  if (_radio->state() == EsnRadioState::FAULTED && _cfg.radio_reset_on_fault) {
    if (_log) _log->log_info("cycle", "radio_reset_attempt", "resetting faulted radio");
    (void)_radio->reset();
  }

  _sensors->begin_sampling();
  if (_log) {
    StaticJsonDocument<96> extra;
    extra["cycle"] = _current.cycle;
    extra["radio_state"] = esn_radio_state_name(_radio->state());
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_debug("cycle", "cycle_start", "cycle start", &o);
  }
  set_phase(EsnCyclePhase::SAMPLING);
}

void EsnOrchestrator::step_sampling() {
  if (deadline_passed()) {
    finish(EsnCycleOutcome::DEADLINE_EXCEEDED);
    return;
  }
  if (_sensors->sample_step()) set_phase(EsnCyclePhase::ENCODING);
}

bool EsnOrchestrator::apply_drop_policy(std::vector<EsnSensorReading>& readings) {
  const size_t max = _encoder->max_payload_bytes();
  for (size_t i = 0; i < _cfg.drop_order_count && i < kEsnChannelCount; ++i) {
    if (EsnPayloadEncoder::encoded_size(readings) <= max) break;
    const EsnChannel ch = _cfg.drop_order[i];
    bool dropped = false;
    for (size_t r = 0; r < readings.size(); ++r) {
      if (readings[r].channel == ch && readings[r].valid) {
        readings[r].valid = false;
        dropped = true;
      }
    }
    if (dropped) _current.dropped.push_back(ch);
  }

  if (_log && !_current.dropped.empty()) {
    StaticJsonDocument<256> extra;
    JsonArray arr = extra.createNestedArray("channels");
    for (size_t i = 0; i < _current.dropped.size(); ++i) arr.add(esn_channel_name(_current.dropped[i]));
    extra["encoded_size"] = (uint32_t)EsnPayloadEncoder::encoded_size(readings);
    extra["max_payload_bytes"] = (uint32_t)max;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_warn("cycle", "payload_channels_dropped", "dropped low-priority channels", &o);
  }
  return EsnPayloadEncoder::encoded_size(readings) <= max;
}

void EsnOrchestrator::step_encoding() {
  std::vector<EsnSensorReading> readings = _sensors->results();
  _current.readings = readings.size();
  for (size_t i = 0; i < readings.size(); ++i) {
    if (readings[i].valid) _current.valid_readings++;
  }

  if (_current.valid_readings == 0) {
    if (_log) _log->log_warn("cycle", "no_valid_readings", "no valid readings; skipping transmit");
    finish(EsnCycleOutcome::NO_DATA);
    return;
  }

  EsnEncodeError err = EsnEncodeError::NONE;
  if (!_encoder->encode(readings, _payload, err)) {
    if (_log) {
      StaticJsonDocument<96> extra;
      extra["encoded_size"] = (uint32_t)EsnPayloadEncoder::encoded_size(readings);
      extra["max_payload_bytes"] = (uint32_t)_encoder->max_payload_bytes();
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_warn("cycle", "payload_overflow", "payload exceeds maximum size", &o);
    }
    (void)apply_drop_policy(readings);
    if (!_encoder->encode(readings, _payload, err)) {
      if (_log) _log->log_error("cycle", "payload_overflow_abort", "payload still too large; cycle aborted");
      finish(EsnCycleOutcome::ENCODE_OVERFLOW);
      return;
    }
    if (_payload.entry_count() == 0) {
      if (_log) _log->log_warn("cycle", "no_valid_readings", "every reading was dropped; skipping transmit");
      finish(EsnCycleOutcome::NO_DATA);
      return;
    }
  }

  _current.payload_entries = _payload.entry_count();
  _current.payload_bytes = _payload.size();
  set_phase(EsnCyclePhase::JOINING);
}

void EsnOrchestrator::log_deadline() {
  if (!_log) return;
  StaticJsonDocument<96> extra;
  extra["cycle"] = _current.cycle;
  extra["phase"] = esn_cycle_phase_name(_phase);
  extra["deadline_ms"] = _cfg.cycle_deadline_ms;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  _log->log_warn("cycle", "cycle_deadline_exceeded", "cycle deadline reached; radio operation abandoned", &o);
}

void EsnOrchestrator::step_joining() {
  // Counted as a join failure so the next wake still backs off.
  if (deadline_passed()) {
    log_deadline();
    _radio->abort_operation();
    finish(EsnCycleOutcome::JOIN_FAILED);
    return;
  }

  switch (_radio->join_step()) {
    case EsnJoinStep::WAITING: {
      uint32_t wait = _radio->join_wait_ms();
      if (wait == 0) return;
      uint32_t now = _clock->now_ms();
      uint32_t remaining = _deadline_ms - now;
      _power->nap(wait < remaining ? wait : remaining);
      return;
    }
    case EsnJoinStep::JOINED:
      set_phase(EsnCyclePhase::TRANSMITTING);
      return;
    case EsnJoinStep::JOIN_FAILED:
      finish(EsnCycleOutcome::JOIN_FAILED);
      return;
    case EsnJoinStep::STORAGE_FAILED:
      _current.storage_error = EsnStorageError::WRITE_FAILED;
      finish(EsnCycleOutcome::JOIN_FAILED);
      return;
    case EsnJoinStep::FAULTED:
      finish(EsnCycleOutcome::RADIO_FAULT);
      return;
  }
}

void EsnOrchestrator::step_transmitting() {
  if (deadline_passed()) {
    log_deadline();
    _radio->abort_operation();
    finish(EsnCycleOutcome::TX_TIMEOUT);
    return;
  }

  if (!_uplink_started) {
    switch (_radio->start_uplink(_payload)) {
      case EsnUplinkOutcome::PENDING:
        _uplink_started = true;
        _current.fcnt_used = _radio->last_fcnt_used();
        return;
      case EsnUplinkOutcome::NEEDS_JOIN:
        // One rejoin per cycle; the join budget bounds it further.
        if (!_rejoined) {
          _rejoined = true;
          set_phase(EsnCyclePhase::JOINING);
          return;
        }
        finish(EsnCycleOutcome::SESSION_EXPIRED);
        return;
      case EsnUplinkOutcome::STORAGE_FAILED:
        _current.storage_error = EsnStorageError::WRITE_FAILED;
        finish(EsnCycleOutcome::STORAGE_FAILED);
        return;
      case EsnUplinkOutcome::NOT_READY:
        finish(EsnCycleOutcome::RADIO_NOT_READY);
        return;
      default:
        finish(EsnCycleOutcome::RADIO_FAULT);
        return;
    }
  }

  switch (_radio->transmit_step()) {
    case EsnUplinkOutcome::PENDING:
      return;
    case EsnUplinkOutcome::SENT:
      _current.transmitted = true;
      finish(EsnCycleOutcome::TRANSMITTED);
      return;
    case EsnUplinkOutcome::ACK_TIMEOUT:
      _current.transmitted = true;
      finish(EsnCycleOutcome::ACK_TIMEOUT);
      return;
    case EsnUplinkOutcome::TX_TIMEOUT:
      finish(EsnCycleOutcome::TX_TIMEOUT);
      return;
    case EsnUplinkOutcome::NEEDS_JOIN:
      finish(EsnCycleOutcome::SESSION_EXPIRED);
      return;
    default:
      finish(EsnCycleOutcome::RADIO_FAULT);
      return;
  }
}

void EsnOrchestrator::finish(EsnCycleOutcome outcome) {
  _current.outcome = outcome;
  _current.duration_ms = _clock->now_ms() - _cycle_start_ms;
  _current.sleep_ms = _power->next_wake_delay(outcome);
  _pending_sleep_ms = _current.sleep_ms;

  if (_log) {
    StaticJsonDocument<kCycleExtraBytes> extra;
    extra["cycle"] = _current.cycle;
    extra["outcome"] = esn_cycle_outcome_name(outcome);
    extra["readings"] = (uint32_t)_current.readings;
    extra["valid_readings"] = (uint32_t)_current.valid_readings;
    extra["payload_entries"] = (uint32_t)_current.payload_entries;
    extra["payload_bytes"] = (uint32_t)_current.payload_bytes;
    if (!_current.dropped.empty()) {
      JsonArray arr = extra.createNestedArray("dropped");
      for (size_t i = 0; i < _current.dropped.size(); ++i) arr.add(esn_channel_name(_current.dropped[i]));
    }
    extra["transmitted"] = _current.transmitted;
    if (_uplink_started) extra["fcnt_up"] = _current.fcnt_used;
    if (_current.storage_error != EsnStorageError::NONE) {
      extra["storage_error"] = esn_storage_error_name(_current.storage_error);
    }
    extra["duration_ms"] = _current.duration_ms;
    extra["sleep_ms"] = _current.sleep_ms;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    if (outcome == EsnCycleOutcome::TRANSMITTED || outcome == EsnCycleOutcome::NO_DATA) {
      _log->log_info("cycle", "cycle_complete", "cycle complete", &o);
    } else {
      _log->log_warn("cycle", "cycle_complete", "cycle complete with failure", &o);
    }
  }

  _last = _current;
  _cycles_done++;
  set_phase(EsnCyclePhase::SLEEPING);
}

void EsnOrchestrator::step_sleeping() {
  _radio->enter_sleep();
  _power->sleep(_pending_sleep_ms);
  _radio->wake();
  set_phase(EsnCyclePhase::IDLE);
}
