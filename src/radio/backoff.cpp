// src/radio/backoff.cpp
// Role: Exponential backoff with cap and jitter.

#include "backoff.h"

#include "../platform/hal.h"

void EsnBackoff::begin(const EsnBackoffConfig& cfg, EsnEntropy* entropy) {
  _cfg = cfg;
  if (_cfg.multiplier < 1.0f) _cfg.multiplier = 1.0f;
  if (_cfg.base_ms > _cfg.cap_ms) _cfg.base_ms = _cfg.cap_ms;
  _entropy = entropy;
}

uint32_t EsnBackoff::nominal_ms(uint32_t failures) const {
  if (failures == 0) return 0;
  double v = (double)_cfg.base_ms;
  for (uint32_t i = 1; i < failures; ++i) {
    v *= (double)_cfg.multiplier;
    if (v >= (double)_cfg.cap_ms) return _cfg.cap_ms;
  }
  if (v >= (double)_cfg.cap_ms) return _cfg.cap_ms;
  return (uint32_t)v;
}

uint32_t EsnBackoff::delay_ms(uint32_t failures) {
  uint32_t nominal = nominal_ms(failures);
  if (nominal == 0 || nominal >= _cfg.cap_ms) return nominal;

  double growth = (double)nominal * ((double)_cfg.multiplier - 1.0);
  uint32_t window = _cfg.jitter_ms;
  if (growth < (double)window) window = (uint32_t)growth;

  uint32_t jitter = 0;
  if (window > 0 && _entropy) jitter = _entropy->next_u32() % window;

  uint64_t d = (uint64_t)nominal + jitter;
  if (d > _cfg.cap_ms) d = _cfg.cap_ms;
  return (uint32_t)d;
}
