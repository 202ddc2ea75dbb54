// src/logging/sha256.h
// Role: SHA-256 helpers for record check bytes and key fingerprints.
#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

static const size_t kEsnSha256Bytes = 32;

// Writes the 32-byte digest of `data` to `out`. Returns false if the hash engine failed.
bool esn_sha256(const uint8_t* data, size_t len, uint8_t* out);

// Returns lowercase hex SHA-256 of the provided bytes (empty string on failure).
std::string esn_sha256_hex(const uint8_t* data, size_t len);

// src/logging/sha256.h EOF
