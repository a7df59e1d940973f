/**
 * @file test_device_store.cpp
 * @brief Unit tests for the deduplicating device record store
 */

#include <atomic>
#include <bluescan/device_store.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace bluescan;

// ============================================================================
// Upsert
// ============================================================================

TEST(DeviceRecordStoreTest, StartsEmpty) {
  DeviceRecordStore store;
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(store.snapshot().empty());
}

TEST(DeviceRecordStoreTest, UpsertInsertsNewRecord) {
  DeviceRecordStore store;

  auto record = store.upsert("AA:BB", "Speaker", STATUS_PAIRED);
  EXPECT_EQ(record.id, "AA:BB");
  EXPECT_EQ(record.name, "Speaker");
  EXPECT_EQ(record.status, STATUS_PAIRED);
  EXPECT_EQ(store.size(), 1u);
}

TEST(DeviceRecordStoreTest, UpsertIsIdempotent) {
  DeviceRecordStore store;

  store.upsert("AA:BB", "Speaker", STATUS_PAIRED);
  auto before = store.snapshot();
  store.upsert("AA:BB", "Speaker", STATUS_PAIRED);

  EXPECT_EQ(store.snapshot(), before);
}

TEST(DeviceRecordStoreTest, UpsertReplacesStatus) {
  DeviceRecordStore store;

  store.upsert("AA:BB", "Speaker", STATUS_AVAILABLE);
  auto record = store.upsert("AA:BB", "Speaker", STATUS_CONNECTED);

  EXPECT_EQ(record.status, STATUS_CONNECTED);
  EXPECT_EQ(store.find("AA:BB")->status, STATUS_CONNECTED);
  EXPECT_EQ(store.size(), 1u);
}

TEST(DeviceRecordStoreTest, RealNameReplacesPlaceholder) {
  DeviceRecordStore store;

  store.upsert("112233445566", UNKNOWN_BLE_DEVICE_NAME, "Signal: -70 dBm");
  auto record = store.upsert("112233445566", "Headphones", "Signal: -65 dBm");

  EXPECT_EQ(record.name, "Headphones");
  EXPECT_EQ(record.status, "Signal: -65 dBm");
}

TEST(DeviceRecordStoreTest, PlaceholderNeverReplacesRealName) {
  DeviceRecordStore store;

  store.upsert("112233445566", "Headphones", "Signal: -65 dBm");
  auto record =
      store.upsert("112233445566", UNKNOWN_BLE_DEVICE_NAME, "Signal: -80 dBm");

  EXPECT_EQ(record.name, "Headphones");
  EXPECT_EQ(record.status, "Signal: -80 dBm");
}

TEST(DeviceRecordStoreTest, RealNameIsNotOverwrittenByAnotherRealName) {
  DeviceRecordStore store;

  store.upsert("AA:BB", "Speaker", STATUS_PAIRED);
  auto record = store.upsert("AA:BB", "Living Room", STATUS_CONNECTED);

  EXPECT_EQ(record.name, "Speaker");
}

TEST(DeviceRecordStoreTest, EmptyNameCountsAsPlaceholder) {
  DeviceRecordStore store;

  store.upsert("AA:BB", "", STATUS_AVAILABLE);
  auto record = store.upsert("AA:BB", "Keyboard", STATUS_AVAILABLE);

  EXPECT_EQ(record.name, "Keyboard");
}

TEST(DeviceRecordStoreTest, PreservesFirstDiscoveryOrder) {
  DeviceRecordStore store;

  store.upsert("c", "C", STATUS_AVAILABLE);
  store.upsert("a", "A", STATUS_AVAILABLE);
  store.upsert("b", "B", STATUS_AVAILABLE);
  store.upsert("c", "C", STATUS_CONNECTED);
  store.upsert("a", "A", STATUS_PAIRED);

  auto records = store.snapshot();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].id, "c");
  EXPECT_EQ(records[1].id, "a");
  EXPECT_EQ(records[2].id, "b");
  EXPECT_EQ(records[0].status, STATUS_CONNECTED);
}

TEST(DeviceRecordStoreTest, IdsStayUniqueUnderManyUpserts) {
  DeviceRecordStore store;

  for (int i = 0; i < 1000; ++i) {
    store.upsert("dev" + std::to_string(i % 10), "Device",
                 format_signal_status(-40 - i % 50));
  }

  auto records = store.snapshot();
  ASSERT_EQ(records.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(records[i].id, "dev" + std::to_string(i));
  }
}

// ============================================================================
// Status Updates
// ============================================================================

TEST(DeviceRecordStoreTest, UpdateStatusChangesOnlyStatus) {
  DeviceRecordStore store;
  store.upsert("CC:DD", "Mouse", STATUS_AVAILABLE);

  EXPECT_TRUE(store.update_status("CC:DD", STATUS_CONNECTED));

  auto record = store.find("CC:DD");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->name, "Mouse");
  EXPECT_EQ(record->status, STATUS_CONNECTED);
}

TEST(DeviceRecordStoreTest, UpdateStatusForUnknownIdIsDropped) {
  DeviceRecordStore store;

  EXPECT_FALSE(store.update_status("EE:FF", STATUS_CONNECTED));
  EXPECT_TRUE(store.empty());
  EXPECT_FALSE(store.find("EE:FF").has_value());
}

// ============================================================================
// Clear and Notifications
// ============================================================================

TEST(DeviceRecordStoreTest, ClearRemovesEverything) {
  DeviceRecordStore store;
  store.upsert("a", "A", STATUS_AVAILABLE);
  store.upsert("b", "B", STATUS_AVAILABLE);

  store.clear();
  EXPECT_TRUE(store.empty());

  // Ids are free again and ordering restarts
  store.upsert("b", "B", STATUS_AVAILABLE);
  EXPECT_EQ(store.snapshot()[0].id, "b");
}

TEST(DeviceRecordStoreTest, ChangedFiresOnEveryMutation) {
  DeviceRecordStore store;
  int changes = 0;
  store.on_changed([&] { ++changes; });

  store.upsert("a", "A", STATUS_AVAILABLE);
  store.upsert("a", "A", STATUS_CONNECTED);
  store.update_status("a", STATUS_AVAILABLE);
  store.update_status("missing", STATUS_AVAILABLE);
  store.clear();

  EXPECT_EQ(changes, 4);
}

TEST(DeviceRecordStoreTest, CallbackMayReadTheStore) {
  DeviceRecordStore store;
  size_t seen = 0;
  store.on_changed([&] { seen = store.size(); });

  store.upsert("a", "A", STATUS_AVAILABLE);
  EXPECT_EQ(seen, 1u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(DeviceRecordStoreTest, ConcurrentUpsertsLoseNothing) {
  DeviceRecordStore store;
  constexpr int PER_THREAD = 500;

  auto writer = [&store](const std::string &prefix) {
    for (int i = 0; i < PER_THREAD; ++i) {
      store.upsert(prefix + std::to_string(i), "Device", STATUS_AVAILABLE);
      store.upsert("shared", "Shared", STATUS_AVAILABLE);
    }
  };

  std::thread classic(writer, "classic-");
  std::thread ble(writer, "ble-");
  classic.join();
  ble.join();

  EXPECT_EQ(store.size(), static_cast<size_t>(2 * PER_THREAD + 1));
  EXPECT_TRUE(store.find("classic-499").has_value());
  EXPECT_TRUE(store.find("ble-499").has_value());
}
