// src/radio/radio.h
// Role: Transceiver + LoRaWAN stack seam consumed by the radio controller.
//
// All operations are non-blocking: start_*() queues work, poll_*() pumps the stack and
// reports progress. MAC timing, channel plans and frame crypto stay inside the stack.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include "../storage/session_store.h"

struct EsnJoinCredentials {
  uint8_t dev_eui[8] = {0};   // MSB first
  uint8_t join_eui[8] = {0};  // MSB first
  uint8_t app_key[16] = {0};
};

enum class EsnRadioStatus : uint8_t {
  OK = 0,
  BUSY,             // operation still running
  ACK_PENDING,      // confirmed uplink on air, receive windows open
  NO_JOIN_ACCEPT,   // join request rejected or unanswered
  TIMEOUT,          // stack gave up on the operation
  NO_ACK,           // confirmed uplink sent, no ack in the receive windows
  SESSION_EXPIRED,  // stack can no longer use the session (e.g. counter exhausted)
  HARDWARE_FAULT,
};

const char* esn_radio_status_name(EsnRadioStatus s);

struct EsnUplinkResult {
  bool acked = false;
  bool downlink = false;
  uint32_t fcnt_down = 0;
};

class EsnRadio {
 public:
  virtual ~EsnRadio() {}

  // Configures the transceiver. False means the hardware did not respond.
  virtual bool init() = 0;
  // Full transceiver + stack reset; leaves no session loaded.
  virtual bool reset() = 0;

  virtual bool start_join(const EsnJoinCredentials& creds) = 0;
  // On OK fills `out` with the fresh session (keys, address, counters).
  virtual EsnRadioStatus poll_join(EsnSession& out) = 0;

  virtual bool restore_session(const EsnSession& s) = 0;

  // Transmits with uplink counter `fcnt`.
  virtual bool start_uplink(uint8_t port, const uint8_t* data, size_t len, bool confirmed, uint32_t fcnt) = 0;
  virtual EsnRadioStatus poll_uplink(EsnUplinkResult& out) = 0;

  // Abandons any in-flight operation.
  virtual void abort() = 0;

  virtual void sleep() = 0;
  virtual void wake() = 0;
};
