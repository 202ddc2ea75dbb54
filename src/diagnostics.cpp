// src/diagnostics.cpp
#include "diagnostics.h"

#include <ArduinoJson.h>
#include <esp_mac.h>

#include "logging/event_logger.h"
#include "version.h"

namespace {

struct ResetCause {
  esp_reset_reason_t reason;
  const char* name;
  bool abnormal;
};

static const ResetCause kResetCauses[] = {
    {ESP_RST_POWERON, "POWERON", false},
    {ESP_RST_EXT, "EXT", false},
    {ESP_RST_SW, "SW", false},
    {ESP_RST_DEEPSLEEP, "DEEPSLEEP", false},
    {ESP_RST_PANIC, "PANIC", true},
    {ESP_RST_INT_WDT, "INT_WDT", true},
    {ESP_RST_TASK_WDT, "TASK_WDT", true},
    {ESP_RST_WDT, "WDT", true},
    {ESP_RST_BROWNOUT, "BROWNOUT", true},
};

static String device_suffix() {
  uint8_t mac[6] = {0};
  // eFuse base MAC; no radio stack needs to be up.
  if (esp_efuse_mac_get_default(mac) != ESP_OK) return String("0000");
  char buf[5];
  snprintf(buf, sizeof(buf), "%02X%02X", mac[4], mac[5]);
  return String(buf);
}

}  // namespace

EsnBootInfo esn_get_boot_info() {
  EsnBootInfo b;
  const esp_reset_reason_t r = esp_reset_reason();
  for (size_t i = 0; i < sizeof(kResetCauses) / sizeof(kResetCauses[0]); ++i) {
    if (kResetCauses[i].reason != r) continue;
    b.reset_reason = kResetCauses[i].name;
    b.abnormal_reset = kResetCauses[i].abnormal;
    break;
  }
  b.device_suffix = device_suffix();
  b.free_heap = ESP.getFreeHeap();
  return b;
}

void esn_log_boot_info(const EsnBootInfo& info, EsnEventLogger* log) {
  if (!log) return;
  StaticJsonDocument<256> extra;
  extra["reset_reason"] = info.reset_reason;
  extra["device"] = info.device_suffix.c_str();
  extra["firmware"] = ESN_FIRMWARE_VERSION;
  extra["free_heap"] = info.free_heap;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  if (info.abnormal_reset) {
    log->log_warn("core", "boot", "boot after abnormal reset", &o);
  } else {
    log->log_info("core", "boot", "boot", &o);
  }
}
