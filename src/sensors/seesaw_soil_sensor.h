// src/sensors/seesaw_soil_sensor.h
// Role: Adafruit STEMMA capacitive soil probe (seesaw firmware) on I2C.
//
// Register protocol: write [module, function], wait, read the big-endian result.
//   hw id        0x00 0x01 -> 1 byte
//   temperature  0x00 0x04 -> 4 bytes, 16.16 fixed point degC
//   capacitance  0x0F 0x10 -> 2 bytes, raw counts
#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "sensor_types.h"

class EsnSeesawSoilSensor : public EsnSensor {
 public:
  EsnSeesawSoilSensor(TwoWire& wire, uint8_t addr) : _wire(wire), _addr(addr) {}

  EsnSensorKind kind() const override { return EsnSensorKind::SOIL; }
  const char* id() const override { return "seesaw_soil"; }
  size_t channel_count() const override { return 2; }
  EsnChannel channel_at(size_t i) const override {
    return i == 0 ? EsnChannel::SOIL_TEMPERATURE : EsnChannel::SOIL_MOISTURE;
  }

  bool begin() override;
  EsnSensorError sample(float* values, uint32_t timeout_ms) override;

 private:
  // False on NACK or short read; never retries.
  bool read_register(uint8_t module, uint8_t function, uint8_t* out, size_t len, uint32_t wait_ms);

  TwoWire& _wire;
  uint8_t _addr;
};
