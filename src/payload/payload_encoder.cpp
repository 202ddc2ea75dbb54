// src/payload/payload_encoder.cpp
// Role: Telemetry payload serialization.

#include "payload_encoder.h"

#include <math.h>

static const EsnChannelFormat kFormats[kEsnChannelCount] = {
    {0x01, 0x67, 2, true, 10.0f},    // air_temperature
    {0x02, 0x68, 1, false, 2.0f},    // air_humidity
    {0x03, 0x65, 2, false, 1.0f},    // co2
    {0x04, 0x67, 2, true, 10.0f},    // soil_temperature
    {0x05, 0x65, 2, false, 1.0f},    // soil_moisture
    {0x06, 0x02, 2, true, 100.0f},   // battery
};

const char* esn_encode_error_name(EsnEncodeError e) {
  switch (e) {
    case EsnEncodeError::NONE: return "none";
    case EsnEncodeError::PAYLOAD_OVERFLOW: return "overflow";
  }
  return "unknown";
}

const EsnChannelFormat& esn_channel_format(EsnChannel c) {
  return kFormats[(size_t)c];
}

static int32_t scale_and_clamp(float value, const EsnChannelFormat& f) {
  double scaled = (double)value * (double)f.scale;
  double lo = 0.0;
  double hi = 0.0;
  if (f.value_bytes == 1) {
    lo = f.is_signed ? -128.0 : 0.0;
    hi = f.is_signed ? 127.0 : 255.0;
  } else {
    lo = f.is_signed ? -32768.0 : 0.0;
    hi = f.is_signed ? 32767.0 : 65535.0;
  }
  // round() is half away from zero.
  double r = round(scaled);
  if (r < lo) r = lo;
  if (r > hi) r = hi;
  return (int32_t)r;
}

EsnPayloadEncoder::EsnPayloadEncoder(size_t max_payload_bytes)
    : _max_bytes(max_payload_bytes > kEsnPayloadMtu ? kEsnPayloadMtu : max_payload_bytes) {}

size_t EsnPayloadEncoder::encoded_size(const std::vector<EsnSensorReading>& readings) {
  size_t n = 0;
  for (size_t i = 0; i < readings.size(); ++i) {
    const EsnSensorReading& r = readings[i];
    if (!r.valid) continue;
    n += 2 + esn_channel_format(r.channel).value_bytes;
  }
  return n;
}

bool EsnPayloadEncoder::encode(const std::vector<EsnSensorReading>& readings, EsnPayload& out,
                               EsnEncodeError& err) const {
  err = EsnEncodeError::NONE;
  out = EsnPayload();

  if (encoded_size(readings) > _max_bytes) {
    err = EsnEncodeError::PAYLOAD_OVERFLOW;
    return false;
  }

  for (size_t i = 0; i < readings.size(); ++i) {
    const EsnSensorReading& r = readings[i];
    if (!r.valid) continue;
    const EsnChannelFormat& f = esn_channel_format(r.channel);
    int32_t v = scale_and_clamp(r.value, f);
    out._bytes.push_back(f.channel_id);
    out._bytes.push_back(f.type_tag);
    if (f.value_bytes == 2) {
      uint16_t u = (uint16_t)(v & 0xFFFF);
      out._bytes.push_back((uint8_t)(u >> 8));
      out._bytes.push_back((uint8_t)(u & 0xFF));
    } else {
      out._bytes.push_back((uint8_t)(v & 0xFF));
    }
    out._entries++;
  }
  return true;
}
