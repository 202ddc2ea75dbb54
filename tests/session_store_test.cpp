// tests/session_store_test.cpp

#include <gtest/gtest.h>

#include <string.h>

#include "fakes.h"
#include "logging/event_logger.h"
#include "storage/session_store.h"

namespace {

class SessionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger.begin(&clock, &sink);
    logger.set_min_severity(EsnLogSeverity::DEBUG);
  }

  // Fresh store object over the same backing map, as after a reboot.
  bool remount() {
    store = EsnSessionStore();
    store.begin(&kv, &logger);
    return true;
  }

  FakeClock clock;
  CaptureLogSink sink;
  EsnEventLogger logger;
  MemoryKvStore kv;
  EsnSessionStore store;
};

TEST_F(SessionStoreTest, LoadReturnsWhatWasSaved) {
  ASSERT_TRUE(remount());
  EsnSession s = make_test_session(41);
  s.fcnt_down = 7;
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(store.save(s, err));

  ASSERT_TRUE(remount());
  EsnSession loaded;
  ASSERT_TRUE(store.load(loaded, err));
  EXPECT_EQ(EsnStorageError::NONE, err);
  EXPECT_EQ(s, loaded);
  EXPECT_TRUE(sink.has("session_loaded"));
}

TEST_F(SessionStoreTest, AbsentSessionIsNotCorrupt) {
  ASSERT_TRUE(remount());
  EsnSession loaded;
  EsnStorageError err = EsnStorageError::CORRUPT;
  EXPECT_FALSE(store.load(loaded, err));
  EXPECT_EQ(EsnStorageError::NONE, err);
  EXPECT_TRUE(sink.has("session_absent"));
}

TEST_F(SessionStoreTest, BadRecordLoadsAsCorrupt) {
  ASSERT_TRUE(remount());
  uint8_t junk[EsnSessionStore::kRecordBytes];
  memset(junk, 0xAB, sizeof(junk));
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(kv.put(EsnSessionStore::kRecordKey, junk, sizeof(junk), err));

  EsnSession loaded;
  EXPECT_FALSE(store.load(loaded, err));
  EXPECT_EQ(EsnStorageError::CORRUPT, err);
  EXPECT_TRUE(sink.has("session_corrupt"));
}

TEST_F(SessionStoreTest, WrongVersionOrLengthIsRejected) {
  uint8_t rec[EsnSessionStore::kRecordBytes];
  EsnSessionStore::encode(make_test_session(3), rec);
  EsnSession out;
  EXPECT_TRUE(EsnSessionStore::decode(rec, sizeof(rec), out));
  EXPECT_FALSE(EsnSessionStore::decode(rec, sizeof(rec) - 1, out));

  rec[0] ^= 0x7F;
  EXPECT_FALSE(EsnSessionStore::decode(rec, sizeof(rec), out));
}

TEST_F(SessionStoreTest, ClearForgetsSession) {
  ASSERT_TRUE(remount());
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(store.save(make_test_session(5), err));
  ASSERT_TRUE(store.clear(err));

  ASSERT_TRUE(remount());
  EsnSession loaded;
  EXPECT_FALSE(store.load(loaded, err));
  EXPECT_EQ(EsnStorageError::NONE, err);
}

TEST_F(SessionStoreTest, WriteFailureIsReported) {
  ASSERT_TRUE(remount());
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(store.save(make_test_session(5), err));
  kv.fail_writes = true;
  EXPECT_FALSE(store.save(make_test_session(6), err));
  EXPECT_EQ(EsnStorageError::WRITE_FAILED, err);
  EXPECT_TRUE(sink.has("session_save_failed"));
  EXPECT_EQ(1u, store.save_count());

  ASSERT_TRUE(remount());
  EsnSession loaded;
  ASSERT_TRUE(store.load(loaded, err));
  EXPECT_EQ(5u, loaded.fcnt_up);
}

TEST_F(SessionStoreTest, FullStoreIsReported) {
  ASSERT_TRUE(remount());
  kv.full = true;
  EsnStorageError err = EsnStorageError::NONE;
  EXPECT_FALSE(store.save(make_test_session(1), err));
  EXPECT_EQ(EsnStorageError::FULL, err);
  EXPECT_TRUE(sink.has("session_save_failed"));
}

TEST_F(SessionStoreTest, WithoutBackingStoreNothingPersists) {
  EsnSessionStore bare;
  bare.begin(nullptr, &logger);
  EsnStorageError err = EsnStorageError::NONE;
  EXPECT_FALSE(bare.save(make_test_session(1), err));
  EXPECT_EQ(EsnStorageError::WRITE_FAILED, err);
  EsnSession s;
  EXPECT_FALSE(bare.load(s, err));
}

// A put interrupted after any number of bytes never loads as a different session:
// either the whole new record is there or the load reports Corrupt and forces a rejoin.
TEST_F(SessionStoreTest, TornWriteNeverYieldsAStaleOrMixedSession) {
  ASSERT_TRUE(remount());
  EsnStorageError err = EsnStorageError::NONE;

  for (int kept = 0; kept <= (int)EsnSessionStore::kRecordBytes; ++kept) {
    kv.values.clear();
    ASSERT_TRUE(store.save(make_test_session(9), err));
    kv.tear_next_put = kept;
    EXPECT_FALSE(store.save(make_test_session(10), err)) << "kept " << kept;

    ASSERT_TRUE(remount());
    EsnSession loaded;
    if (store.load(loaded, err)) {
      EXPECT_EQ(make_test_session(10), loaded) << "kept " << kept;
    } else {
      EXPECT_EQ(EsnStorageError::CORRUPT, err) << "kept " << kept;
    }
  }
}

TEST_F(SessionStoreTest, FlippedBitIsDetected) {
  ASSERT_TRUE(remount());
  EsnStorageError err = EsnStorageError::NONE;
  ASSERT_TRUE(store.save(make_test_session(77), err));
  kv.values[EsnSessionStore::kRecordKey][30] ^= 0x04;

  EsnSession loaded;
  EXPECT_FALSE(store.load(loaded, err));
  EXPECT_EQ(EsnStorageError::CORRUPT, err);
}

}  // namespace
