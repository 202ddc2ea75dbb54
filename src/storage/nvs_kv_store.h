// src/storage/nvs_kv_store.h
// Role: EsnKvStore over an NVS namespace (Preferences). One blob per key, named "k<hex>".
#pragma once

#include <Arduino.h>
#include <Preferences.h>

#include "kv_store.h"

class EsnEventLogger;

class EsnNvsKvStore : public EsnKvStore {
 public:
  // Opens the namespace read-write and keeps it open.
  bool begin(const char* ns, EsnEventLogger* log);
  bool ready() const { return _ok; }

  bool get(uint8_t key, uint8_t* out, size_t cap, size_t& out_len, EsnStorageError& err) override;
  bool put(uint8_t key, const uint8_t* value, size_t len, EsnStorageError& err) override;
  bool remove(uint8_t key, EsnStorageError& err) override;

 private:
  static void key_name(uint8_t key, char* out);

  Preferences _prefs;
  EsnEventLogger* _log = nullptr;
  bool _ok = false;
};
