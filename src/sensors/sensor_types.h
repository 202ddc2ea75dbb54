// src/sensors/sensor_types.h
// Role: Channel/reading/error types shared by sensors, the sensor manager and the payload encoder.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

enum class EsnChannel : uint8_t {
  AIR_TEMPERATURE = 0,  // degC
  AIR_HUMIDITY,         // %RH
  CO2,                  // ppm
  SOIL_TEMPERATURE,     // degC
  SOIL_MOISTURE,        // raw capacitance counts
  BATTERY,              // V
};

static const size_t kEsnChannelCount = 6;

enum class EsnSensorKind : uint8_t {
  AIR = 0,
  SOIL,
  SYSTEM,
};

enum class EsnSensorError : uint8_t {
  NONE = 0,
  BUS_TIMEOUT,
  OUT_OF_RANGE,
  NOT_PRESENT,
};

struct EsnSensorReading {
  EsnChannel channel = EsnChannel::AIR_TEMPERATURE;
  float value = 0.0f;
  bool valid = false;
  EsnSensorError error = EsnSensorError::NOT_PRESENT;
};

// Stable config/log names: air_temperature|air_humidity|co2|soil_temperature|soil_moisture|battery
const char* esn_channel_name(EsnChannel c);
bool esn_parse_channel(const std::string& name, EsnChannel& out);
const char* esn_channel_unit(EsnChannel c);

const char* esn_sensor_kind_name(EsnSensorKind k);
const char* esn_sensor_error_name(EsnSensorError e);

// Physically valid domain of a channel; readings outside it are OUT_OF_RANGE.
void esn_channel_domain(EsnChannel c, float& min_out, float& max_out);

static const size_t kEsnMaxChannelsPerSensor = 3;

// One sensor device on a bus. A single measurement may yield several channels
// (the SCD4x reports temperature, humidity and CO2 together).
class EsnSensor {
 public:
  virtual ~EsnSensor() {}

  virtual EsnSensorKind kind() const = 0;
  virtual const char* id() const = 0;

  virtual size_t channel_count() const = 0;
  virtual EsnChannel channel_at(size_t i) const = 0;

  // Probes the device. A false return means NOT_PRESENT until a later probe succeeds.
  virtual bool begin() = 0;

  // Performs one measurement, writing channel_count() values in channel_at() order.
  // Must give up within timeout_ms and report BUS_TIMEOUT; never retries internally.
  virtual EsnSensorError sample(float* values, uint32_t timeout_ms) = 0;
};
