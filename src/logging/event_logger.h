// src/logging/event_logger.h
// Role: Structured JSONL event logger (state transitions, errors, cycle outcomes).
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include <ArduinoJson.h>

class EsnClock;
class EsnLogSink;

enum class EsnLogSeverity : uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

// Each event is one JSON object per line:
//   {"seq":12,"uptime_ms":5021,"severity":"info","source":"radio",
//    "event_type":"state_transition","msg":"state transition", ...extra}
// - Monotonic sequence number (RAM only, restarts at 1 on boot)
// - A RAM ring buffer of recent events
// - Values passed in `extra` are copied verbatim: callers never pass secrets here
class EsnEventLogger {
 public:
  // Both pointers are optional; without a sink events only land in the RAM ring.
  void begin(EsnClock* clock, EsnLogSink* sink);

  void set_min_severity(EsnLogSeverity s) { _min_severity = s; }
  EsnLogSeverity min_severity() const { return _min_severity; }

  void log_debug(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_info (const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_warn (const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);
  void log_error(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra = nullptr);

  // Adds a config change event. Only key names are allowed.
  void log_config_change(const char* source, const JsonArrayConst& changed_keys);

  // Copies the last N events into `out` as a JSON array of objects (oldest first).
  void recent_events(JsonDocument& out, size_t limit) const;

  size_t event_count() const { return _count; }
  uint32_t last_seq() const { return _seq; }

 private:
  static void put_base_fields(JsonDocument& d, uint32_t seq, uint32_t uptime_ms, EsnLogSeverity severity,
                              const char* source, const char* event_type, const std::string& msg);
  void log_internal(EsnLogSeverity severity, const char* source, const char* event_type, const std::string& msg,
                    const JsonObjectConst* extra);

  static constexpr size_t kMaxEvents = 40;

  EsnClock* _clock = nullptr;
  EsnLogSink* _sink = nullptr;
  EsnLogSeverity _min_severity = EsnLogSeverity::INFO;
  uint32_t _seq = 0;

  std::string _events[kMaxEvents];
  size_t _head = 0;
  size_t _count = 0;
};

const char* esn_severity_name(EsnLogSeverity s);

// Parses debug|info|warn|error. Returns false (and leaves out untouched) on anything else.
bool esn_parse_severity(const std::string& name, EsnLogSeverity& out);
