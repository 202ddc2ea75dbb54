// src/sensors/scd4x_air_sensor.cpp
// Role: Sensirion SCD4x (CO2 + temperature + humidity) on I2C.

#include "scd4x_air_sensor.h"

namespace {
static const uint32_t kPollIntervalMs = 100;
} // namespace

EsnChannel EsnScd4xAirSensor::channel_at(size_t i) const {
  switch (i) {
    case 0: return EsnChannel::AIR_TEMPERATURE;
    case 1: return EsnChannel::AIR_HUMIDITY;
    default: return EsnChannel::CO2;
  }
}

bool EsnScd4xAirSensor::begin() {
  // Periodic mode (one result every 5 s) with automatic self-calibration on.
  return _scd.begin(_wire, true, true);
}

EsnSensorError EsnScd4xAirSensor::sample(float* values, uint32_t timeout_ms) {
  const uint32_t start_ms = millis();
  // readMeasurement() returns false until a fresh result is in the sensor buffer.
  while (!_scd.readMeasurement()) {
    if ((uint32_t)(millis() - start_ms) >= timeout_ms) return EsnSensorError::BUS_TIMEOUT;
    delay(kPollIntervalMs);
  }
  values[0] = _scd.getTemperature();
  values[1] = _scd.getHumidity();
  values[2] = (float)_scd.getCO2();
  return EsnSensorError::NONE;
}
