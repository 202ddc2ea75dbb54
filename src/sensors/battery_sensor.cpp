// src/sensors/battery_sensor.cpp
// Role: Battery voltage via a resistor divider into an ADC pin.

#include "battery_sensor.h"

namespace {
static const int kSamples = 8;
} // namespace

bool EsnBatterySensor::begin() {
  if (_pin < 0) return false;
  analogSetPinAttenuation(_pin, ADC_11db);
  return true;
}

EsnSensorError EsnBatterySensor::sample(float* values, uint32_t timeout_ms) {
  (void)timeout_ms;
  if (_pin < 0) return EsnSensorError::NOT_PRESENT;
  // Calibrated (eFuse) millivolts, averaged over a few conversions.
  uint32_t sum_mv = 0;
  for (int i = 0; i < kSamples; ++i) sum_mv += analogReadMilliVolts(_pin);
  values[0] = ((float)sum_mv / kSamples) * _divider / 1000.0f;
  return EsnSensorError::NONE;
}
