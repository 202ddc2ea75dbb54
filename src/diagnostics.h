// src/diagnostics.h
// Role: Boot facts (reset cause, device id, heap) and the boot event.
#pragma once
#include <Arduino.h>

class EsnEventLogger;

struct EsnBootInfo {
  const char* reset_reason = "UNKNOWN";
  // Panic, watchdog or brownout: the previous run did not end cleanly.
  bool abnormal_reset = false;
  String device_suffix;  // last 4 hex chars of the base MAC
  uint32_t free_heap = 0;
};

EsnBootInfo esn_get_boot_info();

// One "boot" event; warn severity after an abnormal reset.
void esn_log_boot_info(const EsnBootInfo& info, EsnEventLogger* log);
