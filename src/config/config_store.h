// src/config/config_store.h
// Role: Persistent configuration store (schema-versioned, migration-aware) and the typed
// node configuration derived from it.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../orchestrator/orchestrator.h"
#include "../power/power_manager.h"
#include "../radio/backoff.h"
#include "../radio/radio_controller.h"
#include "../sensors/sensor_manager.h"

class EsnSettingsBackend;

// Everything the runtime needs, static for the process lifetime.
struct EsnNodeConfig {
  EsnSensorManagerConfig sensors;
  size_t max_payload_bytes = 51;
  EsnBackoffConfig backoff;
  EsnRadioControllerConfig radio;
  EsnJoinCredentials credentials;
  bool credentials_set = false;
  EsnPowerConfig power;
  EsnOrchestratorConfig orchestrator;
  EsnLogSeverity log_level = EsnLogSeverity::INFO;
};

// ConfigStore contract:
// - Stores one JSON document in the settings backend (NVS on device), chunked when large
// - Enforces schema_version and provides a migration hook for v1.x
// - Wrong-typed or out-of-range values fall back to defaults (config_value_invalid)
// - Corrupt/invalid storage recovery resets to defaults
// - Supports redaction for secrets in logs and status output
class EsnConfigStore {
 public:
  bool begin(EsnSettingsBackend* backend, EsnEventLogger* logger);

  bool ok() const { return _ok; }

  const JsonDocument& doc() const { return _doc; }

  // Typed view of the current document.
  EsnNodeConfig node_config() const;

  // Secrets are replaced with "***".
  void to_redacted_json(JsonDocument& out) const;

  // Applies a patch (partial JSON object).
  // - Only known keys are updated; unknown keys are ignored.
  // - Values must match the key's type and range, otherwise they are skipped.
  // - Never logs secret values; changed key names are logged as config_change.
  // Returns true if something changed.
  bool apply_patch(const JsonObjectConst& patch, std::string& err, JsonArray changed_keys_out);

  bool save(std::string& err);

  // Clears config to defaults and persists.
  bool factory_reset(std::string& err);

 private:
  bool load(std::string& err);
  void set_defaults();
  bool validate_or_recover(std::string& err);
  bool value_valid(const char* key, const JsonVariantConst& v) const;

  // v1.x migration framework.
  bool migrate_if_needed(uint32_t from_version, uint32_t to_version, std::string& err);

  static bool is_secret_key(const char* key);

  bool _ok = false;
  EsnSettingsBackend* _backend = nullptr;
  EsnEventLogger* _logger = nullptr;

  DynamicJsonDocument _doc{4096};
};

// Parses `hex_chars / 2` bytes of hex (MSB first). Empty or malformed input returns false.
bool esn_parse_hex(const char* hex, uint8_t* out, size_t out_len);
