// src/sensors/battery_sensor.h
// Role: Battery voltage via a resistor divider into an ADC pin.
#pragma once

#include <Arduino.h>

#include "sensor_types.h"

class EsnBatterySensor : public EsnSensor {
 public:
  EsnBatterySensor(int pin, float divider) : _pin(pin), _divider(divider) {}

  EsnSensorKind kind() const override { return EsnSensorKind::SYSTEM; }
  const char* id() const override { return "battery"; }
  size_t channel_count() const override { return 1; }
  EsnChannel channel_at(size_t) const override { return EsnChannel::BATTERY; }

  bool begin() override;
  EsnSensorError sample(float* values, uint32_t timeout_ms) override;

 private:
  int _pin;
  float _divider;
};
