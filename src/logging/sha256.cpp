// src/logging/sha256.cpp
// Role: SHA-256 helpers for record check bytes and key fingerprints.

#include "sha256.h"

#include "mbedtls/sha256.h"

static std::string hex_lower(const uint8_t* bytes, size_t len) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += kHex[(bytes[i] >> 4) & 0x0F];
    out += kHex[bytes[i] & 0x0F];
  }
  return out;
}

bool esn_sha256(const uint8_t* data, size_t len, uint8_t* out) {
  if (!out) return false;
  static const uint8_t kEmpty = 0;
  if (!data) {
    data = &kEmpty;
    len = 0;
  }

  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  bool ok = mbedtls_sha256_starts_ret(&ctx, 0) == 0 &&
            mbedtls_sha256_update_ret(&ctx, data, len) == 0 &&
            mbedtls_sha256_finish_ret(&ctx, out) == 0;
  mbedtls_sha256_free(&ctx);
  return ok;
}

std::string esn_sha256_hex(const uint8_t* data, size_t len) {
  uint8_t digest[kEsnSha256Bytes];
  if (!esn_sha256(data, len, digest)) return std::string();
  return hex_lower(digest, sizeof(digest));
}

// src/logging/sha256.cpp EOF
