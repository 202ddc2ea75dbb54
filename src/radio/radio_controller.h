// src/radio/radio_controller.h
// Role: Join/uplink state machine that owns the radio and keeps the session durable.
//
// Canonical states:
// - IDLE          no usable session
// - JOINING       join in flight or waiting for a retry slot
// - JOINED        session loaded, ready to transmit
// - TRANSMITTING  uplink on air
// - AWAITING_ACK  confirmed uplink sent, receive windows open
// - SLEEPING      low-power hint; wake() resumes the state it left from
// - FAULTED       hardware error; everything fails fast until reset()
//
// Uplink counter rule: the counter is reserved and persisted as "next = c + 1" BEFORE the
// frame with counter c is handed to the stack. A counter is never put on air twice.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "../storage/session_store.h"
#include "backoff.h"
#include "radio.h"

class EsnClock;
class EsnEventLogger;
class EsnPayload;

enum class EsnRadioState : uint8_t {
  IDLE = 0,
  JOINING,
  JOINED,
  TRANSMITTING,
  AWAITING_ACK,
  SLEEPING,
  FAULTED,
};

const char* esn_radio_state_name(EsnRadioState s);

enum class EsnJoinStep : uint8_t {
  WAITING = 0,     // in flight or backing off; call again
  JOINED,
  JOIN_FAILED,     // retry budget for this wake exhausted
  STORAGE_FAILED,  // joined but the session could not be persisted
  FAULTED,
};

enum class EsnUplinkOutcome : uint8_t {
  PENDING = 0,
  SENT,             // unconfirmed sent, or confirmed and acked
  ACK_TIMEOUT,      // confirmed, no ack; counter stays consumed
  TX_TIMEOUT,       // stack never completed; radio reset, session restored
  NEEDS_JOIN,       // session expired or counter threshold reached; session invalidated
  STORAGE_FAILED,   // counter could not be persisted; nothing transmitted
  FAULTED,
  NOT_READY,        // not in JOINED
};

struct EsnRadioControllerConfig {
  uint32_t join_attempts_per_wake = 3;
  uint32_t join_timeout_ms = 20000;
  uint32_t uplink_timeout_ms = 15000;
  bool uplink_confirmed = false;
  uint8_t uplink_fport = 1;
  uint32_t fcnt_rejoin_threshold = 0xFFFF0000UL;
};

class EsnRadioController {
 public:
  // Initializes the radio and restores a persisted session when one is valid.
  // Returns false when the radio is FAULTED after init.
  bool begin(const EsnRadioControllerConfig& cfg, const EsnJoinCredentials& creds, EsnRadio* radio,
             EsnSessionStore* store, EsnBackoff* backoff, EsnClock* clock, EsnEventLogger* log);

  EsnRadioState state() const { return _state; }
  bool has_session() const { return _has_session; }
  const EsnSession& session() const { return _session; }
  EsnStorageError last_load_error() const { return _load_error; }

  // Starts a new wake: refills the join retry budget.
  void begin_wake();

  // Non-blocking join driver.
  EsnJoinStep join_step();
  // Milliseconds until the next join attempt may start (0 when it can start now).
  uint32_t join_wait_ms() const;
  uint32_t join_attempts() const { return _join_attempts; }

  // Reserves + persists the counter, then queues the frame. Returns PENDING on success.
  EsnUplinkOutcome start_uplink(const EsnPayload& payload);
  EsnUplinkOutcome transmit_step();
  // Counter of the last frame handed to the stack (valid once start_uplink returned PENDING).
  uint32_t last_fcnt_used() const { return _last_fcnt; }

  // Abandons an in-flight operation (cycle deadline). Returns to JOINED/IDLE.
  void abort_operation();

  // Drops the session everywhere (explicit re-provisioning or expiry).
  void invalidate_session(const char* reason);

  // Recovers from FAULTED. False when the hardware is still not responding.
  bool reset();

  void enter_sleep();
  void wake();

 private:
  void transition(EsnRadioState next, const char* reason);
  void enter_fault(const char* reason);
  EsnJoinStep join_failure(EsnRadioStatus why);
  bool recover_after_timeout();

  EsnRadioControllerConfig _cfg;
  EsnJoinCredentials _creds;
  EsnRadio* _radio = nullptr;
  EsnSessionStore* _store = nullptr;
  EsnBackoff* _backoff = nullptr;
  EsnClock* _clock = nullptr;
  EsnEventLogger* _log = nullptr;

  EsnRadioState _state = EsnRadioState::IDLE;
  EsnRadioState _pre_sleep = EsnRadioState::IDLE;

  EsnSession _session;
  bool _has_session = false;
  EsnStorageError _load_error = EsnStorageError::NONE;

  uint32_t _join_attempts = 0;
  bool _join_in_flight = false;
  uint32_t _join_deadline_ms = 0;
  uint32_t _next_join_ms = 0;

  uint32_t _tx_deadline_ms = 0;
  uint32_t _last_fcnt = 0;
};
