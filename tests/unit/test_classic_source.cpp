/**
 * @file test_classic_source.cpp
 * @brief Unit tests for the classic/paired discovery source
 */

#include "../fake_platform.h"
#include <bluescan/classic_source.h>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace bluescan;
using namespace bluescan::fake;

// ============================================================================
// Normalization
// ============================================================================

TEST(ClassicNormalizationTest, AddedWithoutConnectivityIsAvailable) {
  auto obs = ClassicDiscoverySource::from_added(device("CC:DD", "Mouse"),
                                                UNKNOWN_DEVICE_NAME);
  EXPECT_EQ(obs.kind, Observation::Kind::Upsert);
  EXPECT_EQ(obs.id, "CC:DD");
  EXPECT_EQ(obs.name, "Mouse");
  EXPECT_EQ(obs.status, STATUS_AVAILABLE);
}

TEST(ClassicNormalizationTest, AddedConnectedIsConnected) {
  auto obs = ClassicDiscoverySource::from_added(device("CC:DD", "Mouse", true),
                                                UNKNOWN_DEVICE_NAME);
  EXPECT_EQ(obs.status, STATUS_CONNECTED);
}

TEST(ClassicNormalizationTest, AddedDisconnectedIsAvailable) {
  auto obs = ClassicDiscoverySource::from_added(device("CC:DD", "Mouse", false),
                                                UNKNOWN_DEVICE_NAME);
  EXPECT_EQ(obs.status, STATUS_AVAILABLE);
}

TEST(ClassicNormalizationTest, AddedWithoutNameUsesPlaceholder) {
  auto obs = ClassicDiscoverySource::from_added(device("CC:DD", ""),
                                                UNKNOWN_DEVICE_NAME);
  EXPECT_EQ(obs.name, UNKNOWN_DEVICE_NAME);
}

TEST(ClassicNormalizationTest, UpdateWithoutConnectivityIsIgnored) {
  DeviceInformationUpdate update;
  update.id = "CC:DD";
  EXPECT_FALSE(ClassicDiscoverySource::from_update(update).has_value());
}

TEST(ClassicNormalizationTest, UpdateCarriesConnectivity) {
  DeviceInformationUpdate update;
  update.id = "CC:DD";
  update.is_connected = true;

  auto obs = ClassicDiscoverySource::from_update(update);
  ASSERT_TRUE(obs.has_value());
  EXPECT_EQ(obs->kind, Observation::Kind::StatusUpdate);
  EXPECT_EQ(obs->status, STATUS_CONNECTED);

  update.is_connected = false;
  EXPECT_EQ(ClassicDiscoverySource::from_update(update)->status,
            STATUS_AVAILABLE);
}

TEST(ClassicNormalizationTest, PairedIsSeededPaired) {
  auto obs = ClassicDiscoverySource::from_paired(
      device("AA:BB", "Speaker", true, true), UNKNOWN_DEVICE_NAME);
  EXPECT_EQ(obs.status, STATUS_PAIRED);
  EXPECT_EQ(obs.name, "Speaker");
}

// ============================================================================
// Lifecycle
// ============================================================================

class ClassicSourceTest : public ::testing::Test {
protected:
  ClassicSourceTest() : intake(store) {
    config.paired_query_timeout = std::chrono::milliseconds(200);
  }

  FakeScript &script() { return platform.script(); }

  FakePlatform platform;
  ScanConfig config;
  DeviceRecordStore store;
  ObservationIntake intake;
};

TEST_F(ClassicSourceTest, PairedDevicesArePosted) {
  script().paired = {device("AA:BB", "Speaker", false, true)};

  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());
  EXPECT_TRUE(source.is_running());
  ASSERT_TRUE(source.stop().is_ok());
  intake.drain();

  auto record = store.find("AA:BB");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, STATUS_PAIRED);
}

TEST_F(ClassicSourceTest, WatcherEventsArePosted) {
  script().watcher_delay = std::chrono::milliseconds(10);
  script().watcher_added = {device("CC:DD", "Mouse")};
  DeviceInformationUpdate connected;
  connected.id = "CC:DD";
  connected.is_connected = true;
  script().watcher_updates = {connected};

  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  ASSERT_TRUE(source.stop().is_ok());
  intake.drain();

  auto record = store.find("CC:DD");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->name, "Mouse");
  EXPECT_EQ(record->status, STATUS_CONNECTED);
}

TEST_F(ClassicSourceTest, UpdateForUnseenDeviceIsDropped) {
  script().watcher_delay = std::chrono::milliseconds(10);
  DeviceInformationUpdate stale;
  stale.id = "EE:FF";
  stale.is_connected = true;
  script().watcher_updates = {stale};

  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  ASSERT_TRUE(source.stop().is_ok());
  intake.drain();

  EXPECT_TRUE(store.empty());
}

TEST_F(ClassicSourceTest, StartTwiceIsRejected) {
  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());

  auto again = source.start();
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(ClassicSourceTest, HandlersAreRemovedBeforeWatcherStops) {
  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());
  ASSERT_TRUE(source.stop().is_ok());

  EXPECT_TRUE(script().called("watcher.stop"));
  EXPECT_EQ(script().watcher_handlers_at_stop.load(), 0);
  EXPECT_FALSE(source.is_running());
}

TEST_F(ClassicSourceTest, AbortedWatcherIsNotStopped) {
  script().watcher_delay = std::chrono::milliseconds(5);
  script().watcher_aborts = true;

  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  EXPECT_TRUE(source.stop().is_ok());
  EXPECT_FALSE(script().called("watcher.stop"));
}

TEST_F(ClassicSourceTest, StopIsIdempotent) {
  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());

  EXPECT_TRUE(source.stop().is_ok());
  EXPECT_TRUE(source.stop().is_ok());
}

TEST_F(ClassicSourceTest, StopWithoutStartIsHarmless) {
  ClassicDiscoverySource source(platform, intake.sink(), config);
  EXPECT_TRUE(source.stop().is_ok());
  EXPECT_FALSE(script().called("watcher.stop"));
}

TEST_F(ClassicSourceTest, WatcherStartFailureStillRunsPairedQuery) {
  script().watcher_start_error = Error(ErrorCode::BluetoothOff, "Radio off");
  script().paired = {device("AA:BB", "Speaker", false, true)};

  ClassicDiscoverySource source(platform, intake.sink(), config);
  auto started = source.start();
  ASSERT_TRUE(started.is_error());
  EXPECT_EQ(started.error().code, ErrorCode::BluetoothOff);
  EXPECT_FALSE(source.is_running());

  EXPECT_TRUE(source.stop().is_ok());
  intake.drain();
  EXPECT_TRUE(store.find("AA:BB").has_value());
  EXPECT_FALSE(script().called("watcher.stop"));
}

TEST_F(ClassicSourceTest, WatcherCreateFailureIsReported) {
  script().watcher_create_error =
      Error(ErrorCode::BluetoothNotSupported, "No classic radio");

  ClassicDiscoverySource source(platform, intake.sink(), config);
  auto started = source.start();
  ASSERT_TRUE(started.is_error());
  EXPECT_EQ(started.error().code, ErrorCode::BluetoothNotSupported);
}

TEST_F(ClassicSourceTest, PairedQueryFailureIsAbsorbed) {
  script().paired_error = Error(ErrorCode::PermissionDenied, "Denied");

  ClassicDiscoverySource source(platform, intake.sink(), config);
  EXPECT_TRUE(source.start().is_ok());
  EXPECT_TRUE(source.stop().is_ok());
  intake.drain();
  EXPECT_TRUE(store.empty());
}

TEST_F(ClassicSourceTest, SlowPairedQueryIsAwaited) {
  // The configured bound belongs to the platform; the source never times out
  config.paired_query_timeout = std::chrono::milliseconds(20);
  script().paired_delay = std::chrono::milliseconds(150);
  script().paired = {device("AA:BB", "Speaker", false, true)};

  ClassicDiscoverySource source(platform, intake.sink(), config);
  EXPECT_TRUE(source.start().is_ok());
  EXPECT_TRUE(source.stop().is_ok());
  intake.drain();

  auto record = store.find("AA:BB");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, STATUS_PAIRED);
}

TEST_F(ClassicSourceTest, WatcherStopFailureIsReturned) {
  script().watcher_stop_error = Error(ErrorCode::PlatformError, "Bus gone");

  ClassicDiscoverySource source(platform, intake.sink(), config);
  ASSERT_TRUE(source.start().is_ok());

  auto stopped = source.stop();
  ASSERT_TRUE(stopped.is_error());
  EXPECT_EQ(stopped.error().code, ErrorCode::PlatformError);
  EXPECT_FALSE(source.is_running());
}
