// src/radio/radio_controller.cpp
// Role: Join/uplink state machine with save-before-use frame counters.

#include "radio_controller.h"

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../payload/payload_encoder.h"
#include "../platform/hal.h"

const char* esn_radio_state_name(EsnRadioState s) {
  switch (s) {
    case EsnRadioState::IDLE: return "IDLE";
    case EsnRadioState::JOINING: return "JOINING";
    case EsnRadioState::JOINED: return "JOINED";
    case EsnRadioState::TRANSMITTING: return "TRANSMITTING";
    case EsnRadioState::AWAITING_ACK: return "AWAITING_ACK";
    case EsnRadioState::SLEEPING: return "SLEEPING";
    case EsnRadioState::FAULTED: return "FAULTED";
  }
  return "IDLE";
}

const char* esn_radio_status_name(EsnRadioStatus s) {
  switch (s) {
    case EsnRadioStatus::OK: return "ok";
    case EsnRadioStatus::BUSY: return "busy";
    case EsnRadioStatus::ACK_PENDING: return "ack_pending";
    case EsnRadioStatus::NO_JOIN_ACCEPT: return "no_join_accept";
    case EsnRadioStatus::TIMEOUT: return "timeout";
    case EsnRadioStatus::NO_ACK: return "no_ack";
    case EsnRadioStatus::SESSION_EXPIRED: return "session_expired";
    case EsnRadioStatus::HARDWARE_FAULT: return "hardware_fault";
  }
  return "unknown";
}

bool EsnRadioController::begin(const EsnRadioControllerConfig& cfg, const EsnJoinCredentials& creds,
                               EsnRadio* radio, EsnSessionStore* store, EsnBackoff* backoff, EsnClock* clock,
                               EsnEventLogger* log) {
  _cfg = cfg;
  _creds = creds;
  _radio = radio;
  _store = store;
  _backoff = backoff;
  _clock = clock;
  _log = log;
  _state = EsnRadioState::IDLE;
  _pre_sleep = EsnRadioState::IDLE;
  _has_session = false;
  _session = EsnSession();
  _join_attempts = 0;
  _join_in_flight = false;

  // Corrupt or absent: start in IDLE so the first cycle joins.
  EsnSession stored;
  _load_error = EsnStorageError::NONE;
  if (_store && _store->load(stored, _load_error) && stored.joined) {
    _session = stored;
    _has_session = true;
  }

  if (!_radio || !_radio->init()) {
    enter_fault("radio_init_failed");
    return false;
  }

  if (_has_session && _session.fcnt_up >= _cfg.fcnt_rejoin_threshold) {
    invalidate_session("fcnt_rejoin_threshold");
  }

  if (_has_session) {
    if (!_radio->restore_session(_session)) {
      enter_fault("session_restore_failed");
      return false;
    }
    transition(EsnRadioState::JOINED, "session_restored");
  } else if (_log) {
    StaticJsonDocument<96> extra;
    extra["state"] = esn_radio_state_name(_state);
    extra["load_error"] = esn_storage_error_name(_load_error);
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_info("radio", "radio_boot_state", "no session; join required", &o);
  }
  return true;
}

void EsnRadioController::transition(EsnRadioState next, const char* reason) {
  if (next == _state) return;
  EsnRadioState prev = _state;
  _state = next;
  if (!_log) return;
  StaticJsonDocument<192> extra;
  extra["from"] = esn_radio_state_name(prev);
  extra["to"] = esn_radio_state_name(next);
  extra["reason"] = reason ? reason : "unspecified";
  JsonObjectConst o = extra.as<JsonObjectConst>();
  _log->log_info("radio", "state_transition", "state transition", &o);
}

void EsnRadioController::enter_fault(const char* reason) {
  _join_in_flight = false;
  transition(EsnRadioState::FAULTED, reason);
  if (_log) {
    StaticJsonDocument<96> extra;
    extra["reason"] = reason;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_error("radio", "radio_fault", "radio hardware fault; reset required", &o);
  }
}

void EsnRadioController::begin_wake() {
  _join_attempts = 0;
  _join_in_flight = false;
  _next_join_ms = _clock ? _clock->now_ms() : 0;
}

uint32_t EsnRadioController::join_wait_ms() const {
  if (_state != EsnRadioState::JOINING || _join_in_flight || !_clock) return 0;
  uint32_t now = _clock->now_ms();
  if (esn_time_reached(now, _next_join_ms)) return 0;
  return _next_join_ms - now;
}

EsnJoinStep EsnRadioController::join_step() {
  if (_state == EsnRadioState::SLEEPING) wake();
  if (_state == EsnRadioState::FAULTED) return EsnJoinStep::FAULTED;
  if (_has_session && (_state == EsnRadioState::JOINED || _state == EsnRadioState::TRANSMITTING ||
                       _state == EsnRadioState::AWAITING_ACK)) {
    return EsnJoinStep::JOINED;
  }

  const uint32_t now = _clock->now_ms();

  if (!_join_in_flight) {
    if (_join_attempts >= _cfg.join_attempts_per_wake) {
      transition(EsnRadioState::IDLE, "join_budget_exhausted");
      return EsnJoinStep::JOIN_FAILED;
    }
    if (_join_attempts > 0 && !esn_time_reached(now, _next_join_ms)) return EsnJoinStep::WAITING;

    if (!_radio->start_join(_creds)) {
      enter_fault("join_start_failed");
      return EsnJoinStep::FAULTED;
    }
    _join_attempts++;
    _join_in_flight = true;
    _join_deadline_ms = now + _cfg.join_timeout_ms;
    transition(EsnRadioState::JOINING, "session_absent");
    if (_log) {
      StaticJsonDocument<96> extra;
      extra["attempt"] = _join_attempts;
      extra["budget"] = _cfg.join_attempts_per_wake;
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_info("radio", "join_attempt", "join attempt started", &o);
    }
    return EsnJoinStep::WAITING;
  }

  EsnSession fresh;
  EsnRadioStatus st = _radio->poll_join(fresh);
  switch (st) {
    case EsnRadioStatus::BUSY:
    case EsnRadioStatus::ACK_PENDING:
      if (esn_time_reached(now, _join_deadline_ms)) {
        _radio->abort();
        _join_in_flight = false;
        return join_failure(EsnRadioStatus::TIMEOUT);
      }
      return EsnJoinStep::WAITING;

    case EsnRadioStatus::OK: {
      _join_in_flight = false;
      fresh.joined = true;
      EsnStorageError err = EsnStorageError::NONE;
      if (!_store->save(fresh, err)) {
        // A session that is not durable must not be used: its counters could regress.
        _has_session = false;
        _session = EsnSession();
        transition(EsnRadioState::IDLE, "session_persist_failed");
        if (_log) {
          StaticJsonDocument<96> extra;
          extra["error"] = esn_storage_error_name(err);
          JsonObjectConst o = extra.as<JsonObjectConst>();
          _log->log_error("radio", "join_persist_failed", "joined but session not persisted", &o);
        }
        return EsnJoinStep::STORAGE_FAILED;
      }
      _session = fresh;
      _has_session = true;
      transition(EsnRadioState::JOINED, "join_accepted");
      if (_log) {
        StaticJsonDocument<128> extra;
        extra["dev_addr"] = _session.dev_addr;
        extra["attempt"] = _join_attempts;
        JsonObjectConst o = extra.as<JsonObjectConst>();
        _log->log_info("radio", "join_success", "joined network", &o);
      }
      return EsnJoinStep::JOINED;
    }

    case EsnRadioStatus::HARDWARE_FAULT:
      enter_fault("join_hardware_fault");
      return EsnJoinStep::FAULTED;

    default:
      _join_in_flight = false;
      return join_failure(st);
  }
}

EsnJoinStep EsnRadioController::join_failure(EsnRadioStatus why) {
  const uint32_t now = _clock->now_ms();
  const bool exhausted = _join_attempts >= _cfg.join_attempts_per_wake;
  uint32_t delay = 0;
  if (!exhausted) {
    delay = _backoff ? _backoff->delay_ms(_join_attempts) : 0;
    _next_join_ms = now + delay;
  }

  if (_log) {
    StaticJsonDocument<160> extra;
    extra["attempt"] = _join_attempts;
    extra["reason"] = esn_radio_status_name(why);
    if (!exhausted) extra["retry_in_ms"] = delay;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_warn("radio", "join_attempt_failed", "join attempt failed", &o);
  }

  if (exhausted) {
    transition(EsnRadioState::IDLE, "join_budget_exhausted");
    if (_log) {
      StaticJsonDocument<64> extra;
      extra["attempts"] = _join_attempts;
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_warn("radio", "join_failed", "join retry budget exhausted", &o);
    }
    return EsnJoinStep::JOIN_FAILED;
  }
  return EsnJoinStep::WAITING;
}

EsnUplinkOutcome EsnRadioController::start_uplink(const EsnPayload& payload) {
  if (_state == EsnRadioState::FAULTED) return EsnUplinkOutcome::FAULTED;
  if (_state != EsnRadioState::JOINED || !_has_session || payload.empty()) return EsnUplinkOutcome::NOT_READY;

  const uint32_t c = _session.fcnt_up;
  if (c >= _cfg.fcnt_rejoin_threshold) {
    invalidate_session("fcnt_rejoin_threshold");
    return EsnUplinkOutcome::NEEDS_JOIN;
  }

  // Durable before use. On failure the counter stays consumed in RAM: reusing it later is
  // never required, skipping one is harmless.
  _session.fcnt_up = c + 1;
  EsnStorageError err = EsnStorageError::NONE;
  if (!_store->save(_session, err)) {
    if (_log) {
      StaticJsonDocument<128> extra;
      extra["fcnt_up"] = c;
      extra["error"] = esn_storage_error_name(err);
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_error("radio", "fcnt_persist_failed", "uplink counter not persisted; not transmitting", &o);
    }
    return EsnUplinkOutcome::STORAGE_FAILED;
  }

  _last_fcnt = c;
  if (!_radio->start_uplink(_cfg.uplink_fport, payload.data(), payload.size(), _cfg.uplink_confirmed, c)) {
    enter_fault("uplink_start_failed");
    return EsnUplinkOutcome::FAULTED;
  }
  _tx_deadline_ms = _clock->now_ms() + _cfg.uplink_timeout_ms;
  transition(EsnRadioState::TRANSMITTING, _cfg.uplink_confirmed ? "confirmed_uplink" : "uplink");
  return EsnUplinkOutcome::PENDING;
}

bool EsnRadioController::recover_after_timeout() {
  _radio->abort();
  if (!_radio->reset()) {
    enter_fault("radio_reset_failed");
    return false;
  }
  if (!_radio->restore_session(_session)) {
    enter_fault("session_restore_failed");
    return false;
  }
  transition(EsnRadioState::JOINED, "tx_timeout_recovered");
  return true;
}

EsnUplinkOutcome EsnRadioController::transmit_step() {
  if (_state == EsnRadioState::FAULTED) return EsnUplinkOutcome::FAULTED;
  if (_state != EsnRadioState::TRANSMITTING && _state != EsnRadioState::AWAITING_ACK) {
    return EsnUplinkOutcome::NOT_READY;
  }

  EsnUplinkResult r;
  EsnRadioStatus st = _radio->poll_uplink(r);
  const uint32_t now = _clock->now_ms();

  if (st == EsnRadioStatus::ACK_PENDING) {
    transition(EsnRadioState::AWAITING_ACK, "tx_done");
  }

  switch (st) {
    case EsnRadioStatus::BUSY:
    case EsnRadioStatus::ACK_PENDING:
      if (!esn_time_reached(now, _tx_deadline_ms)) return EsnUplinkOutcome::PENDING;
      if (_state == EsnRadioState::AWAITING_ACK) {
        _radio->abort();
        transition(EsnRadioState::JOINED, "ack_timeout");
        if (_log) {
          StaticJsonDocument<64> extra;
          extra["fcnt_up"] = _last_fcnt;
          JsonObjectConst o = extra.as<JsonObjectConst>();
          _log->log_warn("radio", "uplink_ack_timeout", "no ack before deadline", &o);
        }
        return EsnUplinkOutcome::ACK_TIMEOUT;
      }
      // fallthrough: transmit never completed
    case EsnRadioStatus::TIMEOUT:
    case EsnRadioStatus::NO_JOIN_ACCEPT: {
      if (_log) {
        StaticJsonDocument<64> extra;
        extra["fcnt_up"] = _last_fcnt;
        JsonObjectConst o = extra.as<JsonObjectConst>();
        _log->log_warn("radio", "uplink_timeout", "uplink did not complete; resetting radio", &o);
      }
      if (!recover_after_timeout()) return EsnUplinkOutcome::FAULTED;
      return EsnUplinkOutcome::TX_TIMEOUT;
    }

    case EsnRadioStatus::OK: {
      if (r.downlink && r.fcnt_down != _session.fcnt_down) {
        _session.fcnt_down = r.fcnt_down;
        EsnStorageError err = EsnStorageError::NONE;
        if (!_store->save(_session, err) && _log) {
          _log->log_warn("radio", "fcnt_down_persist_failed", "downlink counter not persisted");
        }
      }
      transition(EsnRadioState::JOINED, "tx_complete");
      if (_log) {
        StaticJsonDocument<128> extra;
        extra["fcnt_up"] = _last_fcnt;
        extra["confirmed"] = _cfg.uplink_confirmed;
        extra["acked"] = r.acked;
        if (r.downlink) extra["fcnt_down"] = r.fcnt_down;
        JsonObjectConst o = extra.as<JsonObjectConst>();
        _log->log_info("radio", "uplink_sent", "uplink sent", &o);
      }
      if (_session.fcnt_up >= _cfg.fcnt_rejoin_threshold) invalidate_session("fcnt_rejoin_threshold");
      return EsnUplinkOutcome::SENT;
    }

    case EsnRadioStatus::NO_ACK: {
      transition(EsnRadioState::JOINED, "ack_timeout");
      if (_log) {
        StaticJsonDocument<64> extra;
        extra["fcnt_up"] = _last_fcnt;
        JsonObjectConst o = extra.as<JsonObjectConst>();
        _log->log_warn("radio", "uplink_ack_timeout", "confirmed uplink not acknowledged", &o);
      }
      return EsnUplinkOutcome::ACK_TIMEOUT;
    }

    case EsnRadioStatus::SESSION_EXPIRED:
      _radio->abort();
      invalidate_session("session_expired");
      return EsnUplinkOutcome::NEEDS_JOIN;

    case EsnRadioStatus::HARDWARE_FAULT:
      enter_fault("uplink_hardware_fault");
      return EsnUplinkOutcome::FAULTED;
  }
  return EsnUplinkOutcome::PENDING;
}

void EsnRadioController::abort_operation() {
  if (_state == EsnRadioState::JOINING) {
    if (_join_in_flight) _radio->abort();
    _join_in_flight = false;
    transition(EsnRadioState::IDLE, "aborted");
    return;
  }
  if (_state == EsnRadioState::TRANSMITTING || _state == EsnRadioState::AWAITING_ACK) {
    // Same recovery as a stack timeout: the counter stays consumed.
    (void)recover_after_timeout();
  }
}

void EsnRadioController::invalidate_session(const char* reason) {
  _has_session = false;
  _session = EsnSession();
  EsnStorageError err = EsnStorageError::NONE;
  // A failed clear leaves an old record whose counter is still ahead of anything sent.
  if (_store) (void)_store->clear(err);
  if (_state != EsnRadioState::FAULTED && _state != EsnRadioState::SLEEPING) {
    transition(EsnRadioState::IDLE, reason);
  }
  if (_log) {
    StaticJsonDocument<96> extra;
    extra["reason"] = reason;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_warn("radio", "session_invalidated", "session invalidated; rejoin required", &o);
  }
}

bool EsnRadioController::reset() {
  if (!_radio->reset()) {
    if (_log) _log->log_error("radio", "radio_reset_failed", "radio reset failed; staying FAULTED");
    if (_state != EsnRadioState::FAULTED) enter_fault("radio_reset_failed");
    return false;
  }
  _join_in_flight = false;
  if (_has_session) {
    if (!_radio->restore_session(_session)) {
      enter_fault("session_restore_failed");
      return false;
    }
    transition(EsnRadioState::JOINED, "radio_reset");
  } else {
    transition(EsnRadioState::IDLE, "radio_reset");
  }
  return true;
}

void EsnRadioController::enter_sleep() {
  if (_state == EsnRadioState::SLEEPING) return;
  _pre_sleep = _state;
  if (_state != EsnRadioState::FAULTED) _radio->sleep();
  transition(EsnRadioState::SLEEPING, "low_power_hint");
}

void EsnRadioController::wake() {
  if (_state != EsnRadioState::SLEEPING) return;
  if (_pre_sleep != EsnRadioState::FAULTED) _radio->wake();
  transition(_pre_sleep, "wake");
}
