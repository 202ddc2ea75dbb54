// tests/sha256_test.cpp

#include <gtest/gtest.h>

#include "logging/sha256.h"

TEST(Sha256, KnownVectors) {
  const uint8_t abc[] = {'a', 'b', 'c'};
  EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", esn_sha256_hex(abc, sizeof(abc)));
  EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", esn_sha256_hex(nullptr, 0));
}

TEST(Sha256, RawDigestMatchesHex) {
  const uint8_t abc[] = {'a', 'b', 'c'};
  uint8_t d[kEsnSha256Bytes];
  ASSERT_TRUE(esn_sha256(abc, sizeof(abc), d));
  EXPECT_EQ(0xBA, d[0]);
  EXPECT_EQ(0xAD, d[31]);
  EXPECT_FALSE(esn_sha256(abc, sizeof(abc), nullptr));
}
