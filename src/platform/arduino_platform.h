// src/platform/arduino_platform.h
// Role: Arduino/ESP32 bindings for the hardware seams in hal.h.
#pragma once

#include <Arduino.h>

#include "hal.h"

class EsnArduinoClock : public EsnClock {
 public:
  uint32_t now_ms() override { return millis(); }
};

// JSONL lines to the USB serial console.
class EsnSerialLogSink : public EsnLogSink {
 public:
  void write_line(const std::string& line) override;
};

// Hardware RNG (esp_random); true entropy while the RF subsystem is on, PRNG otherwise.
class EsnEsp32Entropy : public EsnEntropy {
 public:
  uint32_t next_u32() override;
};

// Timer-only light sleep. Deep sleep would drop RAM and the in-flight stack state.
class EsnEsp32LightSleep : public EsnSleepDriver {
 public:
  void sleep_ms(uint32_t ms) override;
};

// NVS via Preferences. Each call opens and closes the namespace.
class EsnPreferencesSettings : public EsnSettingsBackend {
 public:
  explicit EsnPreferencesSettings(const char* ns) : _ns(ns) {}

  bool get_string(const char* key, std::string& out) override;
  bool put_string(const char* key, const std::string& value) override;
  bool remove(const char* key) override;

 private:
  const char* _ns;
};
