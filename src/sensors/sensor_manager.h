// src/sensors/sensor_manager.h
// Role: Sensor abstraction layer that queries every registered sensor independently,
// applies per-channel enables and physical range checks, and aggregates partial results.
//
// - Sensors are registered once at boot (exclusive bus ownership for the process lifetime).
// - One sensor per sample_step(); each step is a cooperative suspension point.
// - A failure on one sensor never blocks the others.
// - Errors are never retried here; retry policy belongs to the orchestrator.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "sensor_types.h"

class EsnClock;
class EsnEventLogger;

struct EsnSensorManagerConfig {
  bool channel_enabled[kEsnChannelCount] = {true, true, true, true, true, true};
  uint32_t air_timeout_ms = 6000;
  uint32_t soil_timeout_ms = 2500;
  uint32_t system_timeout_ms = 200;
};

struct EsnSensorHealth {
  bool present = false;
  EsnSensorError last_error = EsnSensorError::NOT_PRESENT;
  uint32_t consecutive_failures = 0;
  uint32_t last_read_ms = 0;  // duration of the last sample() call
};

class EsnSensorManager {
 public:
  static const size_t kMaxSensors = 6;

  // Registration must happen before begin(). Returns false when the table is full.
  bool add_sensor(EsnSensor* sensor);

  // Probes every registered sensor once.
  void begin(const EsnSensorManagerConfig& cfg, EsnClock* clock, EsnEventLogger* log);

  // Cooperative sampling: begin_sampling() then sample_step() until it returns true.
  void begin_sampling();
  bool sample_step();
  bool sampling_done() const { return _cursor >= _count; }
  const std::vector<EsnSensorReading>& results() const { return _results; }

  // Runs a whole pass. Ordered by registration order, then by each sensor's channel order.
  std::vector<EsnSensorReading> sample_all();

  const EsnSensorHealth& health(size_t i) const { return _health[i]; }
  bool channel_enabled(EsnChannel c) const { return _cfg.channel_enabled[(size_t)c]; }

 private:
  uint32_t timeout_for(EsnSensorKind k) const;
  bool any_channel_enabled(const EsnSensor* s) const;
  void sample_sensor(size_t i);
  void log_failure(const EsnSensor* s, EsnSensorError e, uint32_t elapsed_ms);

  EsnSensorManagerConfig _cfg;
  EsnClock* _clock = nullptr;
  EsnEventLogger* _log = nullptr;

  EsnSensor* _sensors[kMaxSensors] = {nullptr};
  EsnSensorHealth _health[kMaxSensors];
  size_t _count = 0;

  size_t _cursor = 0;
  std::vector<EsnSensorReading> _results;
};
