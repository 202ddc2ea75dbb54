// src/storage/session_store.cpp
// Role: Session record codec + persistence through the key/value store.

#include "session_store.h"

#include <string.h>

#include <ArduinoJson.h>

#include "../logging/event_logger.h"
#include "../logging/sha256.h"
#include "version.h"

const uint8_t EsnSessionStore::kRecordKey;
const size_t EsnSessionStore::kRecordBytes;

static const uint8_t kFlagJoined = 0x01;
static const size_t kCheckBytes = 4;

const char* esn_storage_error_name(EsnStorageError e) {
  switch (e) {
    case EsnStorageError::NONE: return "none";
    case EsnStorageError::CORRUPT: return "corrupt";
    case EsnStorageError::WRITE_FAILED: return "write_failed";
    case EsnStorageError::FULL: return "full";
  }
  return "unknown";
}

bool operator==(const EsnSession& a, const EsnSession& b) {
  return a.joined == b.joined && a.net_id == b.net_id && a.dev_addr == b.dev_addr &&
         memcmp(a.nwk_skey, b.nwk_skey, kEsnSessionKeyBytes) == 0 &&
         memcmp(a.app_skey, b.app_skey, kEsnSessionKeyBytes) == 0 && a.fcnt_up == b.fcnt_up &&
         a.fcnt_down == b.fcnt_down;
}

static void put_u32(uint8_t*& p, uint32_t v) {
  p[0] = (uint8_t)(v);
  p[1] = (uint8_t)(v >> 8);
  p[2] = (uint8_t)(v >> 16);
  p[3] = (uint8_t)(v >> 24);
  p += 4;
}

static uint32_t get_u32(const uint8_t*& p) {
  uint32_t v = (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
  p += 4;
  return v;
}

void EsnSessionStore::encode(const EsnSession& s, uint8_t* out) {
  uint8_t* p = out;
  *p++ = (uint8_t)ESN_SESSION_RECORD_VERSION;
  *p++ = s.joined ? kFlagJoined : 0;
  put_u32(p, s.net_id);
  put_u32(p, s.dev_addr);
  memcpy(p, s.nwk_skey, kEsnSessionKeyBytes);
  p += kEsnSessionKeyBytes;
  memcpy(p, s.app_skey, kEsnSessionKeyBytes);
  p += kEsnSessionKeyBytes;
  put_u32(p, s.fcnt_up);
  put_u32(p, s.fcnt_down);

  uint8_t digest[kEsnSha256Bytes];
  if (esn_sha256(out, kRecordBytes - kCheckBytes, digest)) {
    memcpy(p, digest, kCheckBytes);
  } else {
    // Unverifiable record: load() will report it corrupt rather than trust it.
    memset(p, 0, kCheckBytes);
  }
}

bool EsnSessionStore::decode(const uint8_t* in, size_t len, EsnSession& out) {
  if (len != kRecordBytes) return false;
  if (in[0] != (uint8_t)ESN_SESSION_RECORD_VERSION) return false;

  uint8_t digest[kEsnSha256Bytes];
  if (!esn_sha256(in, kRecordBytes - kCheckBytes, digest)) return false;
  if (memcmp(digest, in + kRecordBytes - kCheckBytes, kCheckBytes) != 0) return false;

  const uint8_t* p = in + 1;
  EsnSession s;
  s.joined = (*p++ & kFlagJoined) != 0;
  s.net_id = get_u32(p);
  s.dev_addr = get_u32(p);
  memcpy(s.nwk_skey, p, kEsnSessionKeyBytes);
  p += kEsnSessionKeyBytes;
  memcpy(s.app_skey, p, kEsnSessionKeyBytes);
  p += kEsnSessionKeyBytes;
  s.fcnt_up = get_u32(p);
  s.fcnt_down = get_u32(p);
  out = s;
  return true;
}

void EsnSessionStore::begin(EsnKvStore* kv, EsnEventLogger* log) {
  _kv = kv;
  _log = log;
}

bool EsnSessionStore::load(EsnSession& out, EsnStorageError& err) {
  err = EsnStorageError::NONE;
  if (!_kv) return false;

  uint8_t buf[kRecordBytes];
  size_t len = 0;
  if (!_kv->get(kRecordKey, buf, sizeof(buf), len, err)) {
    if (err == EsnStorageError::NONE) {
      if (_log) _log->log_info("session", "session_absent", "no stored session");
      return false;
    }
    if (_log) {
      StaticJsonDocument<96> extra;
      extra["error"] = esn_storage_error_name(err);
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_warn("session", "session_corrupt", "stored session unreadable; rejoin required", &o);
    }
    err = EsnStorageError::CORRUPT;
    return false;
  }

  EsnSession s;
  if (!decode(buf, len, s)) {
    err = EsnStorageError::CORRUPT;
    if (_log) {
      StaticJsonDocument<96> extra;
      extra["record_len"] = (uint32_t)len;
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_warn("session", "session_corrupt", "session record failed verification; rejoin required", &o);
    }
    return false;
  }

  out = s;
  if (_log) {
    StaticJsonDocument<128> extra;
    extra["dev_addr"] = s.dev_addr;
    extra["fcnt_up"] = s.fcnt_up;
    extra["fcnt_down"] = s.fcnt_down;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_info("session", "session_loaded", "session restored", &o);
  }
  return true;
}

bool EsnSessionStore::save(const EsnSession& s, EsnStorageError& err) {
  err = EsnStorageError::NONE;
  if (!_kv) {
    err = EsnStorageError::WRITE_FAILED;
    return false;
  }
  uint8_t buf[kRecordBytes];
  encode(s, buf);
  if (!_kv->put(kRecordKey, buf, sizeof(buf), err)) {
    if (_log) {
      StaticJsonDocument<128> extra;
      extra["error"] = esn_storage_error_name(err);
      extra["fcnt_up"] = s.fcnt_up;
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_error("session", "session_save_failed", "session save failed", &o);
    }
    return false;
  }
  _saves++;
  if (_log) {
    StaticJsonDocument<96> extra;
    extra["fcnt_up"] = s.fcnt_up;
    extra["fcnt_down"] = s.fcnt_down;
    JsonObjectConst o = extra.as<JsonObjectConst>();
    _log->log_debug("session", "session_saved", "session saved", &o);
  }
  return true;
}

bool EsnSessionStore::clear(EsnStorageError& err) {
  err = EsnStorageError::NONE;
  if (!_kv) {
    err = EsnStorageError::WRITE_FAILED;
    return false;
  }
  if (!_kv->remove(kRecordKey, err)) {
    if (_log) {
      StaticJsonDocument<96> extra;
      extra["error"] = esn_storage_error_name(err);
      JsonObjectConst o = extra.as<JsonObjectConst>();
      _log->log_error("session", "session_clear_failed", "session clear failed", &o);
    }
    return false;
  }
  if (_log) _log->log_info("session", "session_cleared", "session cleared");
  return true;
}
