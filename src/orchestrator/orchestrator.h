// src/orchestrator/orchestrator.h
// Role: Top-level cooperative cycle: sample -> encode -> (join) -> transmit -> sleep.
//
// loop() runs exactly one step of the phase machine and returns; every return is a
// suspension point. Cycle N+1 starts only after cycle N reached SLEEPING.
//
// Failure policy:
// - partial sensor failure: continue with the valid readings
// - zero valid readings: no transmit, schedule still advances
// - overflow: drop configured channels (lowest priority first), encode once more
// - join failed / faulted: no transmit, sleep backoff escalates
// - counter persist failed: abort before transmit
// - cycle deadline: abandon, radio returned to a defined state, go to sleep. While
//   joining it counts as a join failure and while transmitting as a transmit timeout.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "../payload/payload_encoder.h"
#include "../power/power_manager.h"
#include "../sensors/sensor_types.h"
#include "../storage/kv_store.h"

class EsnClock;
class EsnEventLogger;
class EsnSensorManager;
class EsnRadioController;

enum class EsnCyclePhase : uint8_t {
  IDLE = 0,
  SAMPLING,
  ENCODING,
  JOINING,
  TRANSMITTING,
  SLEEPING,
};

const char* esn_cycle_phase_name(EsnCyclePhase p);

struct EsnOrchestratorConfig {
  uint32_t cycle_deadline_ms = 120000;
  bool radio_reset_on_fault = true;
  // First entry = lowest priority. Channels not listed are never dropped.
  EsnChannel drop_order[kEsnChannelCount] = {EsnChannel::BATTERY, EsnChannel::SOIL_TEMPERATURE,
                                             EsnChannel::AIR_HUMIDITY};
  size_t drop_order_count = 3;
};

struct EsnCycleReport {
  uint32_t cycle = 0;
  EsnCycleOutcome outcome = EsnCycleOutcome::NO_DATA;
  size_t readings = 0;
  size_t valid_readings = 0;
  size_t payload_entries = 0;
  size_t payload_bytes = 0;
  std::vector<EsnChannel> dropped;
  bool transmitted = false;
  uint32_t fcnt_used = 0;
  EsnStorageError storage_error = EsnStorageError::NONE;
  uint32_t duration_ms = 0;
  uint32_t sleep_ms = 0;
};

class EsnOrchestrator {
 public:
  void begin(const EsnOrchestratorConfig& cfg, EsnSensorManager* sensors, EsnPayloadEncoder* encoder,
             EsnRadioController* radio, EsnPowerManager* power, EsnClock* clock, EsnEventLogger* log);

  // One step of the phase machine.
  void loop();

  // Drives loop() until the current (or next) cycle has slept. Returns its report.
  const EsnCycleReport& run_cycle();

  EsnCyclePhase phase() const { return _phase; }
  const EsnCycleReport& last_report() const { return _last; }
  uint32_t cycles_completed() const { return _cycles_done; }

 private:
  void set_phase(EsnCyclePhase next);
  void start_cycle();
  void step_sampling();
  void step_encoding();
  void step_joining();
  void step_transmitting();
  void step_sleeping();
  bool apply_drop_policy(std::vector<EsnSensorReading>& readings);
  bool deadline_passed();
  void log_deadline();
  void finish(EsnCycleOutcome outcome);

  EsnOrchestratorConfig _cfg;
  EsnSensorManager* _sensors = nullptr;
  EsnPayloadEncoder* _encoder = nullptr;
  EsnRadioController* _radio = nullptr;
  EsnPowerManager* _power = nullptr;
  EsnClock* _clock = nullptr;
  EsnEventLogger* _log = nullptr;

  EsnCyclePhase _phase = EsnCyclePhase::IDLE;
  uint32_t _cycle_start_ms = 0;
  uint32_t _deadline_ms = 0;
  bool _uplink_started = false;
  bool _rejoined = false;
  uint32_t _pending_sleep_ms = 0;

  EsnPayload _payload;
  EsnCycleReport _current;
  EsnCycleReport _last;
  uint32_t _cycles_started = 0;
  uint32_t _cycles_done = 0;
};
