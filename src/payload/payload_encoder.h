// src/payload/payload_encoder.h
// Role: Fixed binary telemetry format (Cayenne LPP style). Compatibility contract with the
// network server: channel ids, type tags and scaling below must not change.
//
//   entry = channel u8 | type u8 | value (big-endian)
//
//   air_temperature  0x01  0x67  int16  0.1 degC
//   air_humidity     0x02  0x68  uint8  0.5 %RH
//   co2              0x03  0x65  uint16 1 ppm
//   soil_temperature 0x04  0x67  int16  0.1 degC
//   soil_moisture    0x05  0x65  uint16 1 count
//   battery          0x06  0x02  int16  0.01 V
//
// Invalid readings are skipped. Values are rounded half away from zero and saturated.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "../sensors/sensor_types.h"

// LoRaWAN maximum application payload (best data rate).
static const size_t kEsnPayloadMtu = 222;

enum class EsnEncodeError : uint8_t {
  NONE = 0,
  PAYLOAD_OVERFLOW,
};

const char* esn_encode_error_name(EsnEncodeError e);

class EsnPayload {
 public:
  const uint8_t* data() const { return _bytes.empty() ? nullptr : &_bytes[0]; }
  size_t size() const { return _bytes.size(); }
  size_t entry_count() const { return _entries; }
  bool empty() const { return _bytes.empty(); }
  const std::vector<uint8_t>& bytes() const { return _bytes; }

 private:
  friend class EsnPayloadEncoder;
  std::vector<uint8_t> _bytes;
  size_t _entries = 0;
};

struct EsnChannelFormat {
  uint8_t channel_id;
  uint8_t type_tag;
  uint8_t value_bytes;
  bool is_signed;
  float scale;  // encoded = round(value * scale)
};

const EsnChannelFormat& esn_channel_format(EsnChannel c);

class EsnPayloadEncoder {
 public:
  explicit EsnPayloadEncoder(size_t max_payload_bytes = 51);

  size_t max_payload_bytes() const { return _max_bytes; }

  // Pure: the same readings always give the same bytes.
  bool encode(const std::vector<EsnSensorReading>& readings, EsnPayload& out, EsnEncodeError& err) const;

  // Bytes encode() would produce (valid readings only).
  static size_t encoded_size(const std::vector<EsnSensorReading>& readings);

 private:
  size_t _max_bytes;
};
