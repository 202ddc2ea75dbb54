// src/storage/nvs_kv_store.cpp
// Role: EsnKvStore over an NVS namespace (Preferences). One blob per key, named "k<hex>".

#include "nvs_kv_store.h"

#include <stdio.h>

#include <ArduinoJson.h>

#include "../logging/event_logger.h"

void EsnNvsKvStore::key_name(uint8_t key, char* out) {
  snprintf(out, 4, "k%02x", key);
}

bool EsnNvsKvStore::begin(const char* ns, EsnEventLogger* log) {
  _log = log;
  _ok = _prefs.begin(ns, false);
  if (!_ok && _log) {
    StaticJsonDocument<96> extra;
    extra["ns"] = ns;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_error("storage", "nvs_open_failed", "nvs namespace open failed", &o);
  }
  return _ok;
}

bool EsnNvsKvStore::get(uint8_t key, uint8_t* out, size_t cap, size_t& out_len, EsnStorageError& err) {
  err = EsnStorageError::NONE;
  out_len = 0;
  if (!_ok) {
    err = EsnStorageError::CORRUPT;
    return false;
  }
  char name[4];
  key_name(key, name);
  if (!_prefs.isKey(name)) return false;

  size_t len = _prefs.getBytesLength(name);
  if (len == 0 || len > cap) {
    err = EsnStorageError::CORRUPT;
    return false;
  }
  if (_prefs.getBytes(name, out, cap) != len) {
    err = EsnStorageError::CORRUPT;
    return false;
  }
  out_len = len;
  return true;
}

bool EsnNvsKvStore::put(uint8_t key, const uint8_t* value, size_t len, EsnStorageError& err) {
  err = EsnStorageError::NONE;
  if (!_ok || !value || len == 0) {
    err = EsnStorageError::WRITE_FAILED;
    return false;
  }
  char name[4];
  key_name(key, name);
  // putBytes() commits before returning; a short count means the old blob is still live.
  if (_prefs.putBytes(name, value, len) == len) return true;

  err = _prefs.freeEntries() == 0 ? EsnStorageError::FULL : EsnStorageError::WRITE_FAILED;
  if (_log) {
    StaticJsonDocument<96> extra;
    extra["key"] = key;
    extra["error"] = esn_storage_error_name(err);
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_error("storage", "nvs_put_failed", "nvs write failed", &o);
  }
  return false;
}

bool EsnNvsKvStore::remove(uint8_t key, EsnStorageError& err) {
  err = EsnStorageError::NONE;
  if (!_ok) {
    err = EsnStorageError::WRITE_FAILED;
    return false;
  }
  char name[4];
  key_name(key, name);
  if (!_prefs.isKey(name)) return true;
  if (!_prefs.remove(name)) {
    err = EsnStorageError::WRITE_FAILED;
    return false;
  }
  return true;
}
