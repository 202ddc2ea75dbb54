// src/sensors/seesaw_soil_sensor.cpp
// Role: Adafruit STEMMA capacitive soil probe (seesaw firmware) on I2C.

#include "seesaw_soil_sensor.h"

namespace {

static const uint8_t kModStatus = 0x00;
static const uint8_t kFnHwId = 0x01;
static const uint8_t kFnTemp = 0x04;
static const uint8_t kModTouch = 0x0F;
static const uint8_t kFnTouchCh0 = 0x10;

static const uint8_t kHwIdSamd09 = 0x55;
static const uint8_t kHwIdTiny8x7 = 0x87;

// Conversion times from the seesaw datasheet.
static const uint32_t kTempWaitMs = 1;
static const uint32_t kTouchWaitMs = 5;

// Capacitance reads 0xFFFF while the probe is still settling.
static const uint16_t kTouchNotReady = 0xFFFF;
static const uint32_t kRetryWaitMs = 10;

} // namespace

bool EsnSeesawSoilSensor::read_register(uint8_t module, uint8_t function, uint8_t* out, size_t len,
                                        uint32_t wait_ms) {
  _wire.beginTransmission(_addr);
  _wire.write(module);
  _wire.write(function);
  if (_wire.endTransmission() != 0) return false;
  delay(wait_ms);
  if (_wire.requestFrom(_addr, (uint8_t)len) != len) return false;
  for (size_t i = 0; i < len; ++i) out[i] = (uint8_t)_wire.read();
  return true;
}

bool EsnSeesawSoilSensor::begin() {
  uint8_t hw = 0;
  if (!read_register(kModStatus, kFnHwId, &hw, 1, 1)) return false;
  return hw == kHwIdSamd09 || hw == kHwIdTiny8x7;
}

EsnSensorError EsnSeesawSoilSensor::sample(float* values, uint32_t timeout_ms) {
  const uint32_t start_ms = millis();

  uint8_t t[4];
  if (!read_register(kModStatus, kFnTemp, t, sizeof(t), kTempWaitMs)) return EsnSensorError::BUS_TIMEOUT;
  int32_t raw_t = (int32_t)(((uint32_t)t[0] << 24) | ((uint32_t)t[1] << 16) | ((uint32_t)t[2] << 8) | t[3]);
  values[0] = (float)raw_t / 65536.0f;

  for (;;) {
    uint8_t m[2];
    if (!read_register(kModTouch, kFnTouchCh0, m, sizeof(m), kTouchWaitMs)) return EsnSensorError::BUS_TIMEOUT;
    uint16_t raw_m = (uint16_t)(((uint16_t)m[0] << 8) | m[1]);
    if (raw_m != kTouchNotReady) {
      values[1] = (float)raw_m;
      return EsnSensorError::NONE;
    }
    if ((uint32_t)(millis() - start_ms) >= timeout_ms) return EsnSensorError::BUS_TIMEOUT;
    delay(kRetryWaitMs);
  }
}
