// src/storage/kv_store.h
// Role: Storage error taxonomy + the key/value contract SessionStore persists through.
#pragma once

#include <stddef.h>
#include <stdint.h>

enum class EsnStorageError : uint8_t {
  NONE = 0,
  CORRUPT,       // checksum/format mismatch on load
  WRITE_FAILED,  // physical write rejected
  FULL,          // no room left for the record
};

const char* esn_storage_error_name(EsnStorageError e);

// Key/value records with per-record crash atomicity: a put either lands whole or the
// previous value stays.
class EsnKvStore {
 public:
  virtual ~EsnKvStore() {}

  // Returns false when the key is absent (err == NONE) or unreadable (err set).
  virtual bool get(uint8_t key, uint8_t* out, size_t cap, size_t& out_len, EsnStorageError& err) = 0;
  virtual bool put(uint8_t key, const uint8_t* value, size_t len, EsnStorageError& err) = 0;
  virtual bool remove(uint8_t key, EsnStorageError& err) = 0;
};
