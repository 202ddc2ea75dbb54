// src/radio/lmic_radio.h
// Role: EsnRadio over the MCCI LoRaWAN LMIC stack (SX127x over SPI).
//
// LMIC reports progress through a global onEvent() callback and runs its jobs from
// os_runloop_once(). poll_*() pumps the runloop and turns the latched events into
// EsnRadioStatus values. Only one instance may exist.
#pragma once

#include <Arduino.h>

#include "radio.h"

class EsnLmicRadio : public EsnRadio {
 public:
  EsnLmicRadio();

  bool init() override;
  bool reset() override;

  bool start_join(const EsnJoinCredentials& creds) override;
  EsnRadioStatus poll_join(EsnSession& out) override;

  bool restore_session(const EsnSession& s) override;

  bool start_uplink(uint8_t port, const uint8_t* data, size_t len, bool confirmed, uint32_t fcnt) override;
  EsnRadioStatus poll_uplink(EsnUplinkResult& out) override;

  void abort() override;
  void sleep() override;
  void wake() override;

  // Called from the stack's event callback.
  void handle_event(int ev);
  // Stack key callbacks (LSB-first EUIs as LMIC expects).
  void copy_join_eui(uint8_t* buf) const;
  void copy_dev_eui(uint8_t* buf) const;
  void copy_app_key(uint8_t* buf) const;

 private:
  enum class Op : uint8_t {
    NONE = 0,
    JOIN,
    UPLINK,
  };

  bool _initialized = false;
  Op _op = Op::NONE;
  bool _confirmed = false;
  bool _tx_started = false;

  // Latched by handle_event(), consumed by poll_*().
  volatile bool _ev_joined = false;
  volatile bool _ev_join_failed = false;
  volatile bool _ev_tx_complete = false;
  volatile bool _ev_tx_canceled = false;

  EsnJoinCredentials _creds;
};
