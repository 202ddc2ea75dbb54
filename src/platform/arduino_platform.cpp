// src/platform/arduino_platform.cpp
// Role: Arduino/ESP32 bindings for the hardware seams in hal.h.

#include "arduino_platform.h"

#include <Preferences.h>
#include <esp_random.h>
#include <esp_sleep.h>

void EsnSerialLogSink::write_line(const std::string& line) {
  Serial.println(line.c_str());
}

uint32_t EsnEsp32Entropy::next_u32() {
  return esp_random();
}

void EsnEsp32LightSleep::sleep_ms(uint32_t ms) {
  if (ms == 0) return;
  // Let the console drain; light sleep stops the UART clock.
  Serial.flush();
  esp_sleep_enable_timer_wakeup((uint64_t)ms * 1000ULL);
  if (esp_light_sleep_start() != ESP_OK) {
    // Rejected (e.g. a wakeup source already pending): keep the schedule anyway.
    delay(ms);
  }
}

bool EsnPreferencesSettings::get_string(const char* key, std::string& out) {
  out.clear();
  Preferences prefs;
  if (!prefs.begin(_ns, true)) return false;
  bool found = prefs.isKey(key);
  if (found) {
    String v = prefs.getString(key, "");
    out.assign(v.c_str(), v.length());
  }
  prefs.end();
  return found;
}

bool EsnPreferencesSettings::put_string(const char* key, const std::string& value) {
  Preferences prefs;
  if (!prefs.begin(_ns, false)) return false;
  bool ok = false;
  if (value.empty()) {
    // putString() reports 0 bytes for "", indistinguishable from a failure.
    prefs.remove(key);
    ok = true;
  } else {
    ok = prefs.putString(key, value.c_str()) == value.size();
  }
  prefs.end();
  return ok;
}

bool EsnPreferencesSettings::remove(const char* key) {
  Preferences prefs;
  if (!prefs.begin(_ns, false)) return false;
  if (!prefs.isKey(key)) {
    prefs.end();
    return true;
  }
  bool ok = prefs.remove(key);
  prefs.end();
  return ok;
}
