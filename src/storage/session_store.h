// src/storage/session_store.h
// Role: Persists/restores the LoRaWAN network session (keys + frame counters) across resets.
//
// Record (key 0x01 in the key/value store), little-endian:
//   version u8 | flags u8 | net_id u32 | dev_addr u32 | nwk_skey[16] | app_skey[16] |
//   fcnt_up u32 | fcnt_down u32 | check[4]
// check = first 4 bytes of SHA-256 over everything before it.
//
// fcnt_up is the NEXT uplink counter to use. The radio controller persists fcnt_up + 1
// before putting fcnt_up on air, so a restored session never repeats a counter.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include "kv_store.h"

class EsnEventLogger;

static const size_t kEsnSessionKeyBytes = 16;

struct EsnSession {
  bool joined = false;
  uint32_t net_id = 0;
  uint32_t dev_addr = 0;
  uint8_t nwk_skey[kEsnSessionKeyBytes] = {0};
  uint8_t app_skey[kEsnSessionKeyBytes] = {0};
  uint32_t fcnt_up = 0;
  uint32_t fcnt_down = 0;
};

bool operator==(const EsnSession& a, const EsnSession& b);
inline bool operator!=(const EsnSession& a, const EsnSession& b) { return !(a == b); }

class EsnSessionStore {
 public:
  static const uint8_t kRecordKey = 0x01;
  static const size_t kRecordBytes = 1 + 1 + 4 + 4 + 16 + 16 + 4 + 4 + 4;

  void begin(EsnKvStore* kv, EsnEventLogger* log);

  // Returns true and fills `out` when a valid session exists.
  // Returns false with err == NONE when nothing is stored, or err == CORRUPT when the record
  // fails verification (treated as absent by callers: forces a rejoin).
  bool load(EsnSession& out, EsnStorageError& err);

  // Synchronous: when this returns true the record is durable.
  bool save(const EsnSession& s, EsnStorageError& err);

  // Explicit re-provisioning / invalidation.
  bool clear(EsnStorageError& err);

  uint32_t save_count() const { return _saves; }

  // Exposed for tests that inspect raw records.
  static void encode(const EsnSession& s, uint8_t* out);
  static bool decode(const uint8_t* in, size_t len, EsnSession& out);

 private:
  EsnKvStore* _kv = nullptr;
  EsnEventLogger* _log = nullptr;
  uint32_t _saves = 0;
};
