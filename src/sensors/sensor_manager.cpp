// src/sensors/sensor_manager.cpp
// Role: Sensor abstraction layer (enables, health, timeouts, range validation).

#include "sensor_manager.h"

#include <math.h>

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../platform/hal.h"

const size_t EsnSensorManager::kMaxSensors;

bool EsnSensorManager::add_sensor(EsnSensor* sensor) {
  if (!sensor || _count >= kMaxSensors) return false;
  _sensors[_count] = sensor;
  _health[_count] = EsnSensorHealth();
  _count++;
  return true;
}

void EsnSensorManager::begin(const EsnSensorManagerConfig& cfg, EsnClock* clock, EsnEventLogger* log) {
  _cfg = cfg;
  _clock = clock;
  _log = log;
  _cursor = _count;
  _results.clear();

  for (size_t i = 0; i < _count; ++i) {
    EsnSensor* s = _sensors[i];
    EsnSensorHealth& h = _health[i];
    bool wanted = any_channel_enabled(s);
    h.present = wanted ? s->begin() : false;
    h.last_error = h.present ? EsnSensorError::NONE : EsnSensorError::NOT_PRESENT;
    h.consecutive_failures = 0;

    if (!_log) continue;
    StaticJsonDocument<192> extra;
    extra["sensor_id"] = s->id();
    extra["sensor_kind"] = esn_sensor_kind_name(s->kind());
    extra["enabled_cfg"] = wanted;
    extra["health"] = !wanted ? "disabled" : (h.present ? "ok" : "not_present");
    JsonObjectConst o = extra.as<JsonObjectConst>();
    if (wanted && !h.present) {
      _log->log_warn("sensor", "sensor_not_present", "sensor probe failed", &o);
    } else {
      _log->log_info("sensor", "sensor_init", "sensor init", &o);
    }
  }
}

uint32_t EsnSensorManager::timeout_for(EsnSensorKind k) const {
  switch (k) {
    case EsnSensorKind::AIR: return _cfg.air_timeout_ms;
    case EsnSensorKind::SOIL: return _cfg.soil_timeout_ms;
    case EsnSensorKind::SYSTEM: return _cfg.system_timeout_ms;
  }
  return _cfg.system_timeout_ms;
}

bool EsnSensorManager::any_channel_enabled(const EsnSensor* s) const {
  for (size_t c = 0; c < s->channel_count(); ++c) {
    if (_cfg.channel_enabled[(size_t)s->channel_at(c)]) return true;
  }
  return false;
}

void EsnSensorManager::begin_sampling() {
  _cursor = 0;
  _results.clear();
}

bool EsnSensorManager::sample_step() {
  // Skip sensors whose channels are all disabled: they are never queried.
  while (_cursor < _count && !any_channel_enabled(_sensors[_cursor])) _cursor++;
  if (_cursor >= _count) return true;
  sample_sensor(_cursor);
  _cursor++;
  return sampling_done();
}

std::vector<EsnSensorReading> EsnSensorManager::sample_all() {
  begin_sampling();
  while (!sample_step()) {
  }
  return _results;
}

void EsnSensorManager::log_failure(const EsnSensor* s, EsnSensorError e, uint32_t elapsed_ms) {
  if (!_log) return;
  StaticJsonDocument<192> extra;
  extra["sensor_id"] = s->id();
  extra["sensor_kind"] = esn_sensor_kind_name(s->kind());
  extra["error"] = esn_sensor_error_name(e);
  extra["elapsed_ms"] = elapsed_ms;
  JsonObjectConst o = extra.as<JsonObjectConst>();
  _log->log_warn("sensor", "sensor_read_failed", "sensor read failed", &o);
}

void EsnSensorManager::sample_sensor(size_t i) {
  EsnSensor* s = _sensors[i];
  EsnSensorHealth& h = _health[i];
  const size_t n = s->channel_count() < kEsnMaxChannelsPerSensor ? s->channel_count() : kEsnMaxChannelsPerSensor;

  // One re-probe per pass for a sensor that was missing.
  if (!h.present) {
    h.present = s->begin();
    if (h.present && _log) {
      StaticJsonDocument<96> extra;
      extra["sensor_id"] = s->id();
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_info("sensor", "sensor_recovered", "sensor probe succeeded", &o);
    }
  }

  EsnSensorError err = EsnSensorError::NOT_PRESENT;
  float values[kEsnMaxChannelsPerSensor] = {0.0f, 0.0f, 0.0f};
  uint32_t elapsed = 0;
  if (h.present) {
    const uint32_t timeout = timeout_for(s->kind());
    const uint32_t start = _clock ? _clock->now_ms() : 0;
    err = s->sample(values, timeout);
    elapsed = _clock ? _clock->now_ms() - start : 0;
    // A late answer is still a timeout; the value may be stale.
    if (err == EsnSensorError::NONE && elapsed > timeout) err = EsnSensorError::BUS_TIMEOUT;
  }
  h.last_read_ms = elapsed;
  h.last_error = err;
  if (err == EsnSensorError::NONE) {
    h.consecutive_failures = 0;
  } else {
    h.consecutive_failures++;
    log_failure(s, err, elapsed);
  }

  for (size_t c = 0; c < n; ++c) {
    EsnChannel ch = s->channel_at(c);
    if (!_cfg.channel_enabled[(size_t)ch]) continue;

    EsnSensorReading r;
    r.channel = ch;
    r.error = err;
    if (err == EsnSensorError::NONE) {
      float lo = 0.0f;
      float hi = 0.0f;
      esn_channel_domain(ch, lo, hi);
      r.value = values[c];
      if (!isfinite(r.value) || r.value < lo || r.value > hi) {
        r.error = EsnSensorError::OUT_OF_RANGE;
        if (_log) {
          StaticJsonDocument<160> extra;
          extra["sensor_id"] = s->id();
          extra["channel"] = esn_channel_name(ch);
          if (isfinite(r.value)) extra["value"] = r.value;
          extra["unit"] = esn_channel_unit(ch);
          JsonObjectConst o = extra.as<JsonObjectConst>();
          _log->log_warn("sensor", "sensor_out_of_range", "reading outside physical domain", &o);
        }
      }
    }
    r.valid = r.error == EsnSensorError::NONE;
    _results.push_back(r);
  }
}
