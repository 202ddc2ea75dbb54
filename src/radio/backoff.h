// src/radio/backoff.h
// Role: Exponential backoff with cap and jitter, shared by join retries and sleep extension.
//
//   nominal(k) = min(cap, base * multiplier^(k-1))           k = consecutive failures (>= 1)
//   delay(k)   = min(cap, nominal(k) + jitter)
//   jitter     in [0, min(jitter_bound, nominal(k) * (multiplier - 1)))
//
// The jitter window never reaches the next nominal step, so delays strictly increase
// until the cap and never exceed it.
#pragma once

#include <stdint.h>

class EsnEntropy;

struct EsnBackoffConfig {
  uint32_t base_ms = 15000;
  float multiplier = 2.0f;
  uint32_t cap_ms = 600000;
  uint32_t jitter_ms = 5000;
};

class EsnBackoff {
 public:
  void begin(const EsnBackoffConfig& cfg, EsnEntropy* entropy);

  const EsnBackoffConfig& config() const { return _cfg; }

  uint32_t nominal_ms(uint32_t failures) const;
  uint32_t delay_ms(uint32_t failures);

 private:
  EsnBackoffConfig _cfg;
  EsnEntropy* _entropy = nullptr;
};
