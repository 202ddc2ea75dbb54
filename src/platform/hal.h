// src/platform/hal.h
// Role: Hardware seams consumed by the core (clock, entropy, sleep, settings, log output).
//
// Core code only talks to these interfaces. Arduino/ESP32 bindings live next to this
// header (arduino_*.cpp); unit tests provide in-memory fakes.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

// Monotonic millisecond clock (wraps after ~49 days; compare with esn_time_reached()).
class EsnClock {
 public:
  virtual ~EsnClock() {}
  virtual uint32_t now_ms() = 0;
};

// Source of jitter for backoff delays.
class EsnEntropy {
 public:
  virtual ~EsnEntropy() {}
  virtual uint32_t next_u32() = 0;
};

// Timer-only low-power entry. Returns after the timer fired (RAM preserved).
class EsnSleepDriver {
 public:
  virtual ~EsnSleepDriver() {}
  virtual void sleep_ms(uint32_t ms) = 0;
};

// Small string-valued settings namespace (NVS on device).
class EsnSettingsBackend {
 public:
  virtual ~EsnSettingsBackend() {}
  virtual bool get_string(const char* key, std::string& out) = 0;
  virtual bool put_string(const char* key, const std::string& value) = 0;
  virtual bool remove(const char* key) = 0;
};

// One-way line sink for the JSONL event stream.
class EsnLogSink {
 public:
  virtual ~EsnLogSink() {}
  virtual void write_line(const std::string& line) = 0;
};

// Wrap-safe "now has reached deadline" for millis()-style clocks.
inline bool esn_time_reached(uint32_t now_ms, uint32_t deadline_ms) {
  return (int32_t)(now_ms - deadline_ms) >= 0;
}
