// src/main.cpp
#include <Arduino.h>
#include <Wire.h>

#include "version.h"
#include "diagnostics.h"

#include "config/config_store.h"
#include "config/pin_config.h"
#include "logging/event_logger.h"
#include "logging/sha256.h"
#include "platform/arduino_platform.h"

// Persistent session (NVS blob)
#include "storage/nvs_kv_store.h"
#include "storage/session_store.h"

#include "sensors/battery_sensor.h"
#include "sensors/scd4x_air_sensor.h"
#include "sensors/seesaw_soil_sensor.h"
#include "sensors/sensor_manager.h"

#include "payload/payload_encoder.h"
#include "radio/backoff.h"
#include "radio/lmic_radio.h"
#include "radio/radio_controller.h"
#include "power/power_manager.h"
#include "orchestrator/orchestrator.h"

static const char* kSettingsNamespace = "esn";
static const char* kSessionNamespace = "esn_sess";
static const uint32_t kProvisionHoldMs = 3000;

static EsnArduinoClock g_clock;
static EsnSerialLogSink g_sink;
static EsnEsp32Entropy g_entropy;
static EsnEsp32LightSleep g_sleep;
static EsnPreferencesSettings g_settings(kSettingsNamespace);

static EsnEventLogger g_log;
static EsnConfigStore g_cfg;

static EsnNvsKvStore g_kv;
static EsnSessionStore g_sessions;

static EsnScd4xAirSensor g_air(Wire);
static EsnSeesawSoilSensor g_soil(Wire, ESN_SOIL_I2C_ADDR);
static EsnBatterySensor g_battery(ESN_PIN_BATTERY_ADC, ESN_BATTERY_DIVIDER);
static EsnSensorManager g_sensors;

static EsnPayloadEncoder g_encoder;
static EsnBackoff g_backoff;
static EsnLmicRadio g_lora;
static EsnRadioController g_radio;
static EsnPowerManager g_power;
static EsnOrchestrator g_orchestrator;

// Button must stay low for the whole hold window.
static bool provision_button_held() {
  if (ESN_PIN_PROVISION_BUTTON < 0) return false;
  pinMode(ESN_PIN_PROVISION_BUTTON, INPUT_PULLUP);
  uint32_t start_ms = millis();
  while ((uint32_t)(millis() - start_ms) < kProvisionHoldMs) {
    if (digitalRead(ESN_PIN_PROVISION_BUTTON) != LOW) return false;
    delay(20);
  }
  return true;
}

void setup() {
  Serial.begin(115200);
  delay(200);

  auto boot = esn_get_boot_info();

  Serial.println();
  Serial.println("[ESN] Boot");
  Serial.print("[ESN] Firmware: "); Serial.print(ESN_FIRMWARE_NAME); Serial.print(" "); Serial.println(ESN_FIRMWARE_VERSION);
  Serial.print("[ESN] Reset reason: "); Serial.println(boot.reset_reason);
  Serial.print("[ESN] Device suffix: "); Serial.println(boot.device_suffix);

  g_log.begin(&g_clock, &g_sink);
  esn_log_boot_info(boot, &g_log);

  const bool provision = provision_button_held();

  // ConfigStore
  g_cfg.begin(&g_settings, &g_log);
  if (provision) {
    std::string err;
    if (!g_cfg.factory_reset(err)) {
      StaticJsonDocument<128> extra;
      extra["err"] = err.c_str();
      JsonObjectConst o = extra.as<JsonObjectConst>();
      g_log.log_error("core", "factory_reset_failed", "factory reset failed", &o);
    } else {
      g_log.log_warn("core", "factory_reset", "provision button held; config reset to defaults");
    }
  }
  const EsnNodeConfig node = g_cfg.node_config();
  g_log.set_min_severity(node.log_level);
  if (!node.credentials_set) {
    g_log.log_error("core", "credentials_missing", "join credentials not provisioned; joins will fail");
  } else {
    // The key itself never reaches the log, only a short digest to tell provisionings apart.
    std::string fp = esn_sha256_hex(node.credentials.app_key, sizeof(node.credentials.app_key)).substr(0, 16);
    StaticJsonDocument<128> extra;
    extra["app_key_fp"] = fp.c_str();
    JsonObjectConst o = extra.as<JsonObjectConst>();
    g_log.log_info("core", "credentials_loaded", "join credentials loaded", &o);
  }

  // Session storage
  EsnStorageError serr = EsnStorageError::NONE;
  const bool kv_ok = g_kv.begin(kSessionNamespace, &g_log);
  g_sessions.begin(kv_ok ? &g_kv : nullptr, &g_log);
  if (provision && kv_ok) {
    if (!g_sessions.clear(serr)) {
      g_log.log_error("core", "provision_incomplete", "stored session kept; next boot restores it");
    }
  }

  // Sensors
  Wire.begin(ESN_PIN_I2C_SDA, ESN_PIN_I2C_SCL);
  g_sensors.add_sensor(&g_air);
  g_sensors.add_sensor(&g_soil);
  g_sensors.add_sensor(&g_battery);
  g_sensors.begin(node.sensors, &g_clock, &g_log);

  // Radio + power
  g_encoder = EsnPayloadEncoder(node.max_payload_bytes);
  g_backoff.begin(node.backoff, &g_entropy);
  if (!g_radio.begin(node.radio, node.credentials, &g_lora, &g_sessions, &g_backoff, &g_clock, &g_log)) {
    g_log.log_error("core", "radio_init_failed", "radio faulted at boot; reset retried each cycle");
  }
  g_power.begin(node.power, &g_backoff, &g_sleep, &g_log);

  g_orchestrator.begin(node.orchestrator, &g_sensors, &g_encoder, &g_radio, &g_power, &g_clock, &g_log);
  Serial.println("[ESN] Orchestrator: OK");
}

void loop() {
  g_orchestrator.loop();
}
