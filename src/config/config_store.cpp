// src/config/config_store.cpp
// Role: Implementation of schema-versioned ConfigStore persisted in the settings backend.

#include "config_store.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "../platform/hal.h"
#include "version.h"

static const char* kPrefsKeyCfg = "cfg_json";
static const char* kPrefsKeyCfgChunks = "cfg_chunks";
static const char* kPrefsKeyCfgChunkPrefix = "cfg_chunk_";
static const size_t kCfgSingleMaxBytes = 1800;
static const size_t kCfgChunkBytes = 1024;
static const uint32_t kCfgChunkMax = 16;

static const char* kChannelEnableKeys[kEsnChannelCount] = {
    "ch_air_temperature_enabled", "ch_air_humidity_enabled", "ch_co2_enabled",
    "ch_soil_temperature_enabled", "ch_soil_moisture_enabled", "ch_battery_enabled",
};

struct EsnNumericRule {
  const char* key;
  double min;
  double max;
  bool min_exclusive;
  bool integer;
};

static const EsnNumericRule kNumericRules[] = {
    {"sample_interval_s", 1, 86400, false, true},
    {"max_payload_bytes", 1, 222, false, true},
    {"backoff_base_ms", 1, 86400000, false, true},
    {"backoff_multiplier", 1, 16, true, false},
    {"backoff_cap_ms", 1, 86400000, false, true},
    {"backoff_jitter_ms", 0, 3600000, false, true},
    {"sleep_ceiling_s", 1, 604800, false, true},
    {"join_attempts_per_wake", 1, 16, false, true},
    {"join_timeout_ms", 1000, 600000, false, true},
    {"uplink_timeout_ms", 1000, 600000, false, true},
    {"uplink_fport", 1, 223, false, true},
    {"fcnt_rejoin_threshold", 1, 4294967295.0, false, true},
    {"cycle_deadline_ms", 1000, 3600000, false, true},
    {"air_sensor_timeout_ms", 1, 60000, false, true},
    {"soil_sensor_timeout_ms", 1, 60000, false, true},
    {"system_sensor_timeout_ms", 1, 60000, false, true},
};

static std::string cfg_chunk_key(uint32_t idx) {
  char buf[24];
  snprintf(buf, sizeof(buf), "%s%u", kPrefsKeyCfgChunkPrefix, (unsigned)idx);
  return std::string(buf);
}

static uint32_t backend_get_u32(EsnSettingsBackend* b, const char* key) {
  std::string s;
  if (!b->get_string(key, s) || s.empty()) return 0;
  return (uint32_t)strtoul(s.c_str(), nullptr, 10);
}

static void clear_cfg_chunks(EsnSettingsBackend* b, uint32_t count) {
  for (uint32_t i = 0; i < count; i++) {
    std::string key = cfg_chunk_key(i);
    (void)b->remove(key.c_str());
  }
  (void)b->remove(kPrefsKeyCfgChunks);
}

static bool json_equals(const JsonVariantConst& a, const JsonVariantConst& b) {
  if (a.isNull() && b.isNull()) return true;
  if (a.is<const char*>() && b.is<const char*>()) {
    return strcmp(a.as<const char*>(), b.as<const char*>()) == 0;
  }
  if (a.is<bool>() && b.is<bool>()) return a.as<bool>() == b.as<bool>();
  if (a.is<long>() && b.is<long>()) return a.as<long>() == b.as<long>();
  if (a.is<double>() && b.is<double>()) return a.as<double>() == b.as<double>();
  // Fallback: compare serialized forms
  std::string sa, sb;
  serializeJson(a, sa);
  serializeJson(b, sb);
  return sa == sb;
}

// Same JSON kind (bool / number / string / array / object).
static bool same_kind(const JsonVariantConst& a, const JsonVariantConst& b) {
  if (a.is<bool>() || b.is<bool>()) return a.is<bool>() && b.is<bool>();
  if (a.is<const char*>() || b.is<const char*>()) return a.is<const char*>() && b.is<const char*>();
  if (a.is<JsonArrayConst>() || b.is<JsonArrayConst>()) return a.is<JsonArrayConst>() && b.is<JsonArrayConst>();
  if (a.is<JsonObjectConst>() || b.is<JsonObjectConst>()) return a.is<JsonObjectConst>() && b.is<JsonObjectConst>();
  return a.is<double>() && b.is<double>();
}

static void write_defaults(JsonObject root) {
  root["schema_version"] = (uint32_t)ESN_CONFIG_SCHEMA_VERSION;

  // Cycle
  root["sample_interval_s"] = 300;
  root["cycle_deadline_ms"] = 120000;

  // Channels
  for (size_t i = 0; i < kEsnChannelCount; ++i) root[kChannelEnableKeys[i]] = true;

  // Payload: first entry of the drop order is dropped first.
  root["max_payload_bytes"] = 51;
  JsonArray drop = root.createNestedArray("overflow_drop_order");
  drop.add("battery");
  drop.add("soil_temperature");
  drop.add("air_humidity");

  // Backoff (join retries + sleep extension)
  root["backoff_base_ms"] = 15000;
  root["backoff_multiplier"] = 2.0;
  root["backoff_cap_ms"] = 600000;
  root["backoff_jitter_ms"] = 5000;
  root["sleep_ceiling_s"] = 3600;

  // Radio
  root["join_attempts_per_wake"] = 3;
  root["join_timeout_ms"] = 20000;
  root["uplink_confirmed"] = false;
  root["uplink_timeout_ms"] = 15000;
  root["uplink_fport"] = 1;
  root["fcnt_rejoin_threshold"] = 4294901760UL;
  root["radio_reset_on_fault"] = true;

  // Sensors
  root["air_sensor_timeout_ms"] = 6000;
  root["soil_sensor_timeout_ms"] = 2500;
  root["system_sensor_timeout_ms"] = 200;

  // Logging
  root["log_level"] = "info";

  // Join credentials (hex, MSB first). app_key is a secret.
  root["dev_eui"] = "";
  root["join_eui"] = "";
  root["app_key"] = "";
}

static bool hex_nibble(char c, uint8_t& out) {
  if (c >= '0' && c <= '9') { out = (uint8_t)(c - '0'); return true; }
  if (c >= 'a' && c <= 'f') { out = (uint8_t)(c - 'a' + 10); return true; }
  if (c >= 'A' && c <= 'F') { out = (uint8_t)(c - 'A' + 10); return true; }
  return false;
}

bool esn_parse_hex(const char* hex, uint8_t* out, size_t out_len) {
  if (!hex || strlen(hex) != out_len * 2) return false;
  for (size_t i = 0; i < out_len; ++i) {
    uint8_t hi = 0;
    uint8_t lo = 0;
    if (!hex_nibble(hex[i * 2], hi) || !hex_nibble(hex[i * 2 + 1], lo)) return false;
    out[i] = (uint8_t)((hi << 4) | lo);
  }
  return true;
}

static bool hex_or_empty(const JsonVariantConst& v, size_t bytes) {
  if (!v.is<const char*>()) return false;
  const char* s = v.as<const char*>();
  if (s[0] == '\0') return true;
  uint8_t tmp[16];
  return bytes <= sizeof(tmp) && esn_parse_hex(s, tmp, bytes);
}

bool EsnConfigStore::begin(EsnSettingsBackend* backend, EsnEventLogger* logger) {
  _backend = backend;
  _logger = logger;
  std::string err;
  if (!load(err)) {
    // load() performs recovery attempts and sets defaults if needed
    _ok = false;
    if (_logger) _logger->log_warn("config", "config_load_failed", err);
    return false;
  }
  _ok = true;
  return true;
}

bool EsnConfigStore::load(std::string& err) {
  if (!_backend) {
    err = "settings_backend_missing";
    set_defaults();
    return false;
  }

  std::string cfg;
  bool used_chunked = false;
  uint32_t chunk_count = backend_get_u32(_backend, kPrefsKeyCfgChunks);
  if (chunk_count > 0 && chunk_count <= kCfgChunkMax) {
    for (uint32_t i = 0; i < chunk_count; i++) {
      std::string key = cfg_chunk_key(i);
      std::string part;
      if (!_backend->get_string(key.c_str(), part) || part.empty()) {
        cfg.clear();
        break;
      }
      cfg += part;
    }
    if (!cfg.empty()) used_chunked = true;
  }

  if (!used_chunked) {
    cfg.clear();
    (void)_backend->get_string(kPrefsKeyCfg, cfg);
  }

  if (cfg.empty()) {
    set_defaults();
    std::string save_err;
    if (!save(save_err) && _logger) _logger->log_warn("config", "config_save_failed", save_err);
    if (_logger) _logger->log_info("config", "config_defaults_created", "no_existing_config");
    err.clear();
    return true;
  }

  _doc.clear();
  DeserializationError de = deserializeJson(_doc, cfg);
  if (de) {
    err = std::string("deserialize_failed:") + de.c_str();
    // Corrupt recovery: reset to defaults.
    set_defaults();
    std::string save_err;
    if (!save(save_err) && _logger) _logger->log_warn("config", "config_save_failed", save_err);
    if (_logger) _logger->log_error("config", "config_corrupt_recovered", err);
    err.clear();
    return true;
  }

  // Validate/migrate
  if (!validate_or_recover(err)) {
    // validate_or_recover sets defaults on failure
    std::string save_err;
    if (!save(save_err) && _logger) _logger->log_warn("config", "config_save_failed", save_err);
    if (_logger) _logger->log_error("config", "config_invalid_recovered", err);
    err.clear();
    return true;
  }

  if (_logger) _logger->log_info("config", "cfg_load_ok", "config load ok");
  err.clear();
  return true;
}

void EsnConfigStore::set_defaults() {
  _doc.clear();
  write_defaults(_doc.to<JsonObject>());
}

bool EsnConfigStore::value_valid(const char* key, const JsonVariantConst& v) const {
  for (size_t i = 0; i < sizeof(kNumericRules) / sizeof(kNumericRules[0]); ++i) {
    const EsnNumericRule& r = kNumericRules[i];
    if (strcmp(key, r.key) != 0) continue;
    if (v.is<bool>() || !v.is<double>()) return false;
    double d = v.as<double>();
    if (r.min_exclusive ? d <= r.min : d < r.min) return false;
    if (d > r.max) return false;
    if (r.integer && d != (double)(int64_t)d) return false;
    return true;
  }

  if (strcmp(key, "log_level") == 0) {
    EsnLogSeverity s;
    return v.is<const char*>() && esn_parse_severity(v.as<const char*>(), s);
  }
  if (strcmp(key, "dev_eui") == 0 || strcmp(key, "join_eui") == 0) return hex_or_empty(v, 8);
  if (strcmp(key, "app_key") == 0) return hex_or_empty(v, 16);

  if (strcmp(key, "overflow_drop_order") == 0) {
    if (!v.is<JsonArrayConst>()) return false;
    JsonArrayConst arr = v.as<JsonArrayConst>();
    if (arr.size() > kEsnChannelCount) return false;
    bool seen[kEsnChannelCount] = {false, false, false, false, false, false};
    for (JsonVariantConst e : arr) {
      EsnChannel c;
      if (!e.is<const char*>() || !esn_parse_channel(e.as<const char*>(), c)) return false;
      if (seen[(size_t)c]) return false;
      seen[(size_t)c] = true;
    }
    return true;
  }
  return true;
}

bool EsnConfigStore::validate_or_recover(std::string& err) {
  JsonObject root = _doc.as<JsonObject>();
  if (root.isNull()) {
    err = "root_not_object";
    set_defaults();
    return false;
  }

  uint32_t schema = root["schema_version"] | 0;
  if (schema == 0) {
    // treat missing as v1
    schema = ESN_CONFIG_SCHEMA_VERSION;
    root["schema_version"] = schema;
  }

  if (schema != (uint32_t)ESN_CONFIG_SCHEMA_VERSION) {
    if (!migrate_if_needed(schema, (uint32_t)ESN_CONFIG_SCHEMA_VERSION, err)) {
      std::string detail = err;
      set_defaults();
      err = std::string("schema_incompatible:") + detail;
      return false;
    }
  }

  // Ensure every known key exists with the right type and a sane value.
  // (Append-only rule: unknown keys are tolerated.)
  DynamicJsonDocument defaults(2048);
  write_defaults(defaults.to<JsonObject>());
  bool repaired = false;
  for (JsonPairConst kv : defaults.as<JsonObjectConst>()) {
    const char* key = kv.key().c_str();
    JsonVariantConst current = root.getMember(key);
    if (current.isNull()) {
      root[std::string(key)] = kv.value();
      repaired = true;
      continue;
    }
    if (!same_kind(current, kv.value()) || !value_valid(key, current)) {
      if (_logger) {
        StaticJsonDocument<96> extra;
        extra["key"] = key;
        JsonObjectConst o = extra.as<JsonObjectConst>();
        _logger->log_warn("config", "config_value_invalid", "invalid value replaced by default", &o);
      }
      root[std::string(key)] = kv.value();
      repaired = true;
    }
  }

  if (repaired) {
    std::string save_err;
    if (!save(save_err) && _logger) _logger->log_warn("config", "config_save_failed", save_err);
  }
  return true;
}

bool EsnConfigStore::migrate_if_needed(uint32_t from_version, uint32_t to_version, std::string& err) {
  // A no-op migration is allowed for 1->1.
  if (from_version == to_version) return true;
  char buf[48];
  snprintf(buf, sizeof(buf), "no_migration_path_%u_to_%u", (unsigned)from_version, (unsigned)to_version);
  err = buf;
  return false;
}

bool EsnConfigStore::is_secret_key(const char* key) {
  return strcmp(key, "app_key") == 0;
}

void EsnConfigStore::to_redacted_json(JsonDocument& out) const {
  out.clear();
  JsonObject o = out.to<JsonObject>();
  for (JsonPairConst kv : _doc.as<JsonObjectConst>()) {
    const char* key = kv.key().c_str();
    if (is_secret_key(key)) {
      o[std::string(key)] = "***";
    } else {
      o[std::string(key)] = kv.value();
    }
  }
}

bool EsnConfigStore::apply_patch(const JsonObjectConst& patch, std::string& err, JsonArray changed_keys_out) {
  if (patch.isNull()) {
    err = "patch_not_object";
    return false;
  }

  JsonObject root = _doc.as<JsonObject>();
  bool changed = false;
  err.clear();

  for (JsonPairConst kv : patch) {
    const char* key = kv.key().c_str();
    if (!root.containsKey(key) || strcmp(key, "schema_version") == 0) {
      // Unknown keys are ignored.
      continue;
    }
    if (!same_kind(root.getMember(key), kv.value()) || !value_valid(key, kv.value())) {
      err = std::string("invalid_value:") + key;
      continue;
    }
    if (!json_equals(root.getMember(key), kv.value())) {
      root[key] = kv.value();
      changed = true;
      changed_keys_out.add(std::string(key));
    }
  }

  if (changed && _logger) _logger->log_config_change("config", changed_keys_out);
  return changed;
}

bool EsnConfigStore::save(std::string& err) {
  if (!_backend) {
    err = "settings_backend_missing";
    return false;
  }

  std::string out;
  size_t written = serializeJson(_doc, out);
  if (written == 0 || out.empty()) {
    err = "serialize_failed";
    return false;
  }

  bool ok = false;
  if (out.size() <= kCfgSingleMaxBytes) {
    ok = _backend->put_string(kPrefsKeyCfg, out);
    if (ok) {
      uint32_t prior_chunks = backend_get_u32(_backend, kPrefsKeyCfgChunks);
      if (prior_chunks > 0) clear_cfg_chunks(_backend, prior_chunks);
    }
  }

  if (!ok) {
    uint32_t chunk_count = (uint32_t)((out.size() + kCfgChunkBytes - 1) / kCfgChunkBytes);
    if (chunk_count == 0 || chunk_count > kCfgChunkMax) {
      err = "cfg_too_large";
      return false;
    }

    uint32_t prior_chunks = backend_get_u32(_backend, kPrefsKeyCfgChunks);
    bool chunk_ok = _backend->put_string(kPrefsKeyCfgChunks, "0");
    for (uint32_t i = 0; chunk_ok && i < chunk_count; i++) {
      std::string part = out.substr(i * kCfgChunkBytes, kCfgChunkBytes);
      std::string key = cfg_chunk_key(i);
      if (!_backend->put_string(key.c_str(), part)) chunk_ok = false;
    }
    if (chunk_ok) {
      char count_buf[12];
      snprintf(count_buf, sizeof(count_buf), "%u", (unsigned)chunk_count);
      chunk_ok = _backend->put_string(kPrefsKeyCfgChunks, count_buf);
    }
    if (chunk_ok) {
      (void)_backend->remove(kPrefsKeyCfg);
      for (uint32_t i = chunk_count; i < prior_chunks; i++) {
        std::string key = cfg_chunk_key(i);
        (void)_backend->remove(key.c_str());
      }
      ok = true;
    }
  }

  if (!ok) {
    err = "settings_write_failed";
    return false;
  }
  err.clear();
  return true;
}

bool EsnConfigStore::factory_reset(std::string& err) {
  set_defaults();
  if (!save(err)) return false;
  if (_logger) _logger->log_warn("config", "config_factory_reset", "config reset to defaults");
  return true;
}

EsnNodeConfig EsnConfigStore::node_config() const {
  EsnNodeConfig c;
  JsonObjectConst root = _doc.as<JsonObjectConst>();

  for (size_t i = 0; i < kEsnChannelCount; ++i) {
    c.sensors.channel_enabled[i] = root[kChannelEnableKeys[i]] | true;
  }
  c.sensors.air_timeout_ms = root["air_sensor_timeout_ms"] | 6000UL;
  c.sensors.soil_timeout_ms = root["soil_sensor_timeout_ms"] | 2500UL;
  c.sensors.system_timeout_ms = root["system_sensor_timeout_ms"] | 200UL;

  c.max_payload_bytes = root["max_payload_bytes"] | 51U;

  c.backoff.base_ms = root["backoff_base_ms"] | 15000UL;
  c.backoff.multiplier = root["backoff_multiplier"] | 2.0f;
  c.backoff.cap_ms = root["backoff_cap_ms"] | 600000UL;
  c.backoff.jitter_ms = root["backoff_jitter_ms"] | 5000UL;

  c.radio.join_attempts_per_wake = root["join_attempts_per_wake"] | 3UL;
  c.radio.join_timeout_ms = root["join_timeout_ms"] | 20000UL;
  c.radio.uplink_timeout_ms = root["uplink_timeout_ms"] | 15000UL;
  c.radio.uplink_confirmed = root["uplink_confirmed"] | false;
  c.radio.uplink_fport = (uint8_t)(root["uplink_fport"] | 1U);
  c.radio.fcnt_rejoin_threshold = root["fcnt_rejoin_threshold"] | 4294901760UL;

  c.credentials_set = esn_parse_hex(root["dev_eui"] | "", c.credentials.dev_eui, sizeof(c.credentials.dev_eui)) &&
                      esn_parse_hex(root["join_eui"] | "", c.credentials.join_eui, sizeof(c.credentials.join_eui)) &&
                      esn_parse_hex(root["app_key"] | "", c.credentials.app_key, sizeof(c.credentials.app_key));

  c.power.sample_interval_s = root["sample_interval_s"] | 300UL;
  c.power.sleep_ceiling_s = root["sleep_ceiling_s"] | 3600UL;

  c.orchestrator.cycle_deadline_ms = root["cycle_deadline_ms"] | 120000UL;
  c.orchestrator.radio_reset_on_fault = root["radio_reset_on_fault"] | true;
  c.orchestrator.drop_order_count = 0;
  for (JsonVariantConst e : root["overflow_drop_order"].as<JsonArrayConst>()) {
    EsnChannel ch;
    if (c.orchestrator.drop_order_count >= kEsnChannelCount) break;
    if (e.is<const char*>() && esn_parse_channel(e.as<const char*>(), ch)) {
      c.orchestrator.drop_order[c.orchestrator.drop_order_count++] = ch;
    }
  }

  EsnLogSeverity sev = EsnLogSeverity::INFO;
  if (esn_parse_severity(root["log_level"] | "info", sev)) c.log_level = sev;
  return c;
}
