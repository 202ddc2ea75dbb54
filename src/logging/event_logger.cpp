// src/logging/event_logger.cpp
// Role: Structured JSONL event logger (state transitions, errors, cycle outcomes).

#include "event_logger.h"

#include "../platform/hal.h"
#include "version.h"

// Base fields plus room for the widest extras (cycle_complete with a dropped-channel list)
// and the strings the document has to copy (msg, std::string values).
static const size_t kLineDocBytes = JSON_OBJECT_SIZE(24) + JSON_ARRAY_SIZE(8) + 512;

const char* esn_severity_name(EsnLogSeverity s) {
  switch (s) {
    case EsnLogSeverity::DEBUG: return "debug";
    case EsnLogSeverity::INFO: return "info";
    case EsnLogSeverity::WARN: return "warn";
    case EsnLogSeverity::ERROR: return "error";
  }
  return "info";
}

bool esn_parse_severity(const std::string& name, EsnLogSeverity& out) {
  if (name == "debug") { out = EsnLogSeverity::DEBUG; return true; }
  if (name == "info") { out = EsnLogSeverity::INFO; return true; }
  if (name == "warn") { out = EsnLogSeverity::WARN; return true; }
  if (name == "error") { out = EsnLogSeverity::ERROR; return true; }
  return false;
}

void EsnEventLogger::begin(EsnClock* clock, EsnLogSink* sink) {
  _clock = clock;
  _sink = sink;
}

void EsnEventLogger::put_base_fields(JsonDocument& d, uint32_t seq, uint32_t uptime_ms, EsnLogSeverity severity,
                                     const char* source, const char* event_type, const std::string& msg) {
  d["v"] = ESN_LOG_SCHEMA_VERSION;
  d["seq"] = seq;
  d["uptime_ms"] = uptime_ms;
  d["severity"] = esn_severity_name(severity);
  d["source"] = source;
  d["event_type"] = event_type;
  d["msg"] = msg;
}

void EsnEventLogger::log_internal(EsnLogSeverity severity, const char* source, const char* event_type,
                                  const std::string& msg, const JsonObjectConst* extra) {
  if ((uint8_t)severity < (uint8_t)_min_severity) return;

  const uint32_t seq = ++_seq;
  const uint32_t uptime = _clock ? _clock->now_ms() : 0;

  StaticJsonDocument<kLineDocBytes> d;
  put_base_fields(d, seq, uptime, severity, source, event_type, msg);
  if (extra) {
    // Copy allowed extra fields (caller-owned). Never pass secrets.
    for (JsonPairConst kv : *extra) {
      d[kv.key()] = kv.value();
    }
  }
  if (d.overflowed()) {
    // Keep the event itself; flag that some extras did not fit.
    d.clear();
    put_base_fields(d, seq, uptime, severity, source, event_type, msg);
    d["extra_truncated"] = true;
  }

  std::string line;
  serializeJson(d, line);

  _events[_head] = line;
  _head = (_head + 1) % kMaxEvents;
  if (_count < kMaxEvents) _count++;

  if (_sink) _sink->write_line(line);
}

void EsnEventLogger::log_debug(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal(EsnLogSeverity::DEBUG, source, event_type, msg, extra);
}
void EsnEventLogger::log_info(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal(EsnLogSeverity::INFO, source, event_type, msg, extra);
}
void EsnEventLogger::log_warn(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal(EsnLogSeverity::WARN, source, event_type, msg, extra);
}
void EsnEventLogger::log_error(const char* source, const char* event_type, const std::string& msg, const JsonObjectConst* extra) {
  log_internal(EsnLogSeverity::ERROR, source, event_type, msg, extra);
}

void EsnEventLogger::log_config_change(const char* source, const JsonArrayConst& changed_keys) {
  StaticJsonDocument<384> extra;
  JsonArray arr = extra.createNestedArray("keys");
  for (JsonVariantConst v : changed_keys) {
    arr.add(v);
  }
  JsonObjectConst o = extra.as<JsonObjectConst>();
  log_internal(EsnLogSeverity::INFO, source, "config_change", "config keys updated", &o);
}

void EsnEventLogger::recent_events(JsonDocument& out, size_t limit) const {
  out.clear();
  JsonArray arr = out.to<JsonArray>();
  if (_count == 0) return;

  size_t n = _count;
  if (limit > 0 && limit < n) n = limit;

  // Oldest first, skipping the oldest entries when limited.
  size_t start = (_head + kMaxEvents - n) % kMaxEvents;
  for (size_t i = 0; i < n; i++) {
    size_t idx = (start + i) % kMaxEvents;
    // Parsing copies every key and string of the line.
    StaticJsonDocument<kLineDocBytes + 512> line;
    DeserializationError de = deserializeJson(line, _events[idx]);
    if (!de) arr.add(line);
  }
}
