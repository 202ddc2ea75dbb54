// src/sensors/scd4x_air_sensor.h
// Role: Sensirion SCD4x (CO2 + temperature + humidity) on I2C.
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include <SparkFun_SCD4x_Arduino_Library.h>

#include "sensor_types.h"

class EsnScd4xAirSensor : public EsnSensor {
 public:
  explicit EsnScd4xAirSensor(TwoWire& wire) : _wire(wire) {}

  EsnSensorKind kind() const override { return EsnSensorKind::AIR; }
  const char* id() const override { return "scd4x"; }
  size_t channel_count() const override { return 3; }
  EsnChannel channel_at(size_t i) const override;

  bool begin() override;
  EsnSensorError sample(float* values, uint32_t timeout_ms) override;

 private:
  TwoWire& _wire;
  SCD4x _scd;
};
