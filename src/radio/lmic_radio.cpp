// src/radio/lmic_radio.cpp
// Role: EsnRadio over the MCCI LoRaWAN LMIC stack (SX127x over SPI).

#include "lmic_radio.h"

#include <SPI.h>
#include <lmic.h>
#include <hal/hal.h>

#include "../config/pin_config.h"

namespace {

static EsnLmicRadio* g_radio = nullptr;

// Crystal tolerance of cheap boards widens the RX windows; 1% is what works in the field.
static const uint32_t kClockErrorPercent = 1;

static void reverse_copy(uint8_t* dst, const uint8_t* src, size_t len) {
  for (size_t i = 0; i < len; ++i) dst[i] = src[len - 1 - i];
}

} // namespace

const lmic_pinmap lmic_pins = {
    .nss = ESN_PIN_LORA_NSS,
    .rxtx = LMIC_UNUSED_PIN,
    .rst = ESN_PIN_LORA_RST,
    .dio = {ESN_PIN_LORA_DIO0, ESN_PIN_LORA_DIO1, ESN_PIN_LORA_DIO2},
};

void os_getArtEui(u1_t* buf) {
  if (g_radio) g_radio->copy_join_eui(buf);
}

void os_getDevEui(u1_t* buf) {
  if (g_radio) g_radio->copy_dev_eui(buf);
}

void os_getDevKey(u1_t* buf) {
  if (g_radio) g_radio->copy_app_key(buf);
}

void onEvent(ev_t ev) {
  if (g_radio) g_radio->handle_event((int)ev);
}

EsnLmicRadio::EsnLmicRadio() {
  g_radio = this;
}

void EsnLmicRadio::copy_join_eui(uint8_t* buf) const { reverse_copy(buf, _creds.join_eui, 8); }
void EsnLmicRadio::copy_dev_eui(uint8_t* buf) const { reverse_copy(buf, _creds.dev_eui, 8); }
void EsnLmicRadio::copy_app_key(uint8_t* buf) const { memcpy(buf, _creds.app_key, 16); }

void EsnLmicRadio::handle_event(int ev) {
  switch ((ev_t)ev) {
    case EV_JOINED:
      LMIC_setLinkCheckMode(0);
      _ev_joined = true;
      break;
    case EV_JOIN_TXCOMPLETE:  // join request sent, both RX windows closed without a JoinAccept
    case EV_JOIN_FAILED:
    case EV_REJOIN_FAILED:
      _ev_join_failed = true;
      break;
    case EV_TXSTART:
      _tx_started = true;
      break;
    case EV_TXCOMPLETE:
      _ev_tx_complete = true;
      break;
    case EV_TXCANCELED:
      _ev_tx_canceled = true;
      break;
    default:
      break;
  }
}

bool EsnLmicRadio::init() {
  _initialized = false;
  // os_init_ex() reports a missing or unresponsive transceiver instead of halting.
  if (!os_init_ex(&lmic_pins)) return false;
  LMIC_reset();
  LMIC_setClockError(MAX_CLOCK_ERROR * kClockErrorPercent / 100);
  _op = Op::NONE;
  _initialized = true;
  return true;
}

bool EsnLmicRadio::reset() {
  if (!_initialized) return init();
  LMIC_reset();
  LMIC_setClockError(MAX_CLOCK_ERROR * kClockErrorPercent / 100);
  _op = Op::NONE;
  return true;
}

bool EsnLmicRadio::start_join(const EsnJoinCredentials& creds) {
  if (!_initialized) return false;
  _creds = creds;
  _ev_joined = false;
  _ev_join_failed = false;
  LMIC_reset();
  LMIC_setClockError(MAX_CLOCK_ERROR * kClockErrorPercent / 100);
  if (!LMIC_startJoining()) return false;
  _op = Op::JOIN;
  return true;
}

EsnRadioStatus EsnLmicRadio::poll_join(EsnSession& out) {
  if (_op != Op::JOIN) return EsnRadioStatus::HARDWARE_FAULT;
  os_runloop_once();

  if (_ev_join_failed) {
    _ev_join_failed = false;
    // LMIC would schedule its own retry; the controller's backoff owns retries.
    LMIC_reset();
    _op = Op::NONE;
    return EsnRadioStatus::NO_JOIN_ACCEPT;
  }
  if (!_ev_joined) return EsnRadioStatus::BUSY;
  _ev_joined = false;
  _op = Op::NONE;

  u4_t netid = 0;
  devaddr_t devaddr = 0;
  LMIC_getSessionKeys(&netid, &devaddr, out.nwk_skey, out.app_skey);
  out.joined = true;
  out.net_id = (uint32_t)netid;
  out.dev_addr = (uint32_t)devaddr;
  out.fcnt_up = (uint32_t)LMIC.seqnoUp;
  out.fcnt_down = (uint32_t)LMIC.seqnoDn;
  return EsnRadioStatus::OK;
}

bool EsnLmicRadio::restore_session(const EsnSession& s) {
  if (!_initialized || !s.joined) return false;
  uint8_t nwk[16];
  uint8_t app[16];
  memcpy(nwk, s.nwk_skey, sizeof(nwk));
  memcpy(app, s.app_skey, sizeof(app));
  LMIC_setSession(s.net_id, (devaddr_t)s.dev_addr, nwk, app);
  LMIC_setLinkCheckMode(0);
  LMIC.seqnoUp = (u4_t)s.fcnt_up;
  LMIC.seqnoDn = (u4_t)s.fcnt_down;
  return true;
}

bool EsnLmicRadio::start_uplink(uint8_t port, const uint8_t* data, size_t len, bool confirmed, uint32_t fcnt) {
  if (!_initialized || _op != Op::NONE) return false;
  if (LMIC.opmode & OP_TXRXPEND) return false;
  if (len > MAX_LEN_PAYLOAD) return false;

  _ev_tx_complete = false;
  _ev_tx_canceled = false;
  _tx_started = false;
  _confirmed = confirmed;

  // The counter was reserved and persisted by the caller; LMIC must use exactly it.
  LMIC.seqnoUp = (u4_t)fcnt;
  uint8_t buf[MAX_LEN_PAYLOAD];
  memcpy(buf, data, len);
  if (LMIC_setTxData2(port, buf, (u1_t)len, confirmed ? 1 : 0) != 0) return false;
  _op = Op::UPLINK;
  return true;
}

EsnRadioStatus EsnLmicRadio::poll_uplink(EsnUplinkResult& out) {
  if (_op != Op::UPLINK) return EsnRadioStatus::HARDWARE_FAULT;
  os_runloop_once();

  if (_ev_tx_canceled) {
    _ev_tx_canceled = false;
    _op = Op::NONE;
    return EsnRadioStatus::TIMEOUT;
  }
  if (!_ev_tx_complete) {
    if (_confirmed && _tx_started) return EsnRadioStatus::ACK_PENDING;
    return EsnRadioStatus::BUSY;
  }

  _ev_tx_complete = false;
  _op = Op::NONE;
  out.acked = (LMIC.txrxFlags & TXRX_ACK) != 0;
  out.downlink = LMIC.dataLen > 0;
  out.fcnt_down = (uint32_t)LMIC.seqnoDn;
  if (_confirmed && !out.acked) return EsnRadioStatus::NO_ACK;
  return EsnRadioStatus::OK;
}

void EsnLmicRadio::abort() {
  if (_op == Op::UPLINK) {
    LMIC_clrTxData();
  } else if (_op == Op::JOIN) {
    // Stops the join state machine; the caller restores any session afterwards.
    LMIC_reset();
  }
  _op = Op::NONE;
  _ev_joined = false;
  _ev_join_failed = false;
  _ev_tx_complete = false;
  _ev_tx_canceled = false;
}

void EsnLmicRadio::sleep() {
  // LMIC leaves the SX127x in sleep mode after the last RX window; only SPI is parked.
  SPI.end();
}

void EsnLmicRadio::wake() {
  SPI.begin();
}
