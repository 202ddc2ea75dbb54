// src/sensors/sensor_types.cpp
// Role: Name tables and physical domains for sensor channels.

#include "sensor_types.h"

const char* esn_channel_name(EsnChannel c) {
  switch (c) {
    case EsnChannel::AIR_TEMPERATURE: return "air_temperature";
    case EsnChannel::AIR_HUMIDITY: return "air_humidity";
    case EsnChannel::CO2: return "co2";
    case EsnChannel::SOIL_TEMPERATURE: return "soil_temperature";
    case EsnChannel::SOIL_MOISTURE: return "soil_moisture";
    case EsnChannel::BATTERY: return "battery";
  }
  return "unknown";
}

bool esn_parse_channel(const std::string& name, EsnChannel& out) {
  for (size_t i = 0; i < kEsnChannelCount; ++i) {
    EsnChannel c = (EsnChannel)i;
    if (name == esn_channel_name(c)) {
      out = c;
      return true;
    }
  }
  return false;
}

const char* esn_channel_unit(EsnChannel c) {
  switch (c) {
    case EsnChannel::AIR_TEMPERATURE:
    case EsnChannel::SOIL_TEMPERATURE: return "degC";
    case EsnChannel::AIR_HUMIDITY: return "%RH";
    case EsnChannel::CO2: return "ppm";
    case EsnChannel::SOIL_MOISTURE: return "counts";
    case EsnChannel::BATTERY: return "V";
  }
  return "";
}

const char* esn_sensor_kind_name(EsnSensorKind k) {
  switch (k) {
    case EsnSensorKind::AIR: return "air";
    case EsnSensorKind::SOIL: return "soil";
    case EsnSensorKind::SYSTEM: return "system";
  }
  return "unknown";
}

const char* esn_sensor_error_name(EsnSensorError e) {
  switch (e) {
    case EsnSensorError::NONE: return "none";
    case EsnSensorError::BUS_TIMEOUT: return "bus_timeout";
    case EsnSensorError::OUT_OF_RANGE: return "out_of_range";
    case EsnSensorError::NOT_PRESENT: return "not_present";
  }
  return "unknown";
}

void esn_channel_domain(EsnChannel c, float& min_out, float& max_out) {
  switch (c) {
    case EsnChannel::AIR_TEMPERATURE:
    case EsnChannel::SOIL_TEMPERATURE:
      min_out = -40.0f;
      max_out = 85.0f;
      return;
    case EsnChannel::AIR_HUMIDITY:
      min_out = 0.0f;
      max_out = 100.0f;
      return;
    case EsnChannel::CO2:
      min_out = 0.0f;
      max_out = 40000.0f;
      return;
    case EsnChannel::SOIL_MOISTURE:
      min_out = 0.0f;
      max_out = 4095.0f;
      return;
    case EsnChannel::BATTERY:
      min_out = 0.0f;
      max_out = 6.0f;
      return;
  }
  min_out = 0.0f;
  max_out = 0.0f;
}
