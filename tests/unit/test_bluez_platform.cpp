/**
 * @file test_bluez_platform.cpp
 * @brief Unit tests for the BlueZ platform factory
 *
 * Only paths that never reach the system bus are covered here.
 */

#include <bluescan/bluetooth.h>
#include <gtest/gtest.h>

using namespace bluescan;

TEST(BlueZPlatformTest, CreatesIdleWatchers) {
  ScanConfig config;
  auto platform = make_bluez_platform(config);
  ASSERT_NE(platform.get(), nullptr);

  auto watcher = platform->create_device_watcher();
  ASSERT_TRUE(watcher.is_ok());
  ASSERT_NE(watcher.value().get(), nullptr);
  EXPECT_EQ(watcher.value()->status(), WatcherStatus::Created);

  auto advertisements = platform->create_advertisement_watcher();
  ASSERT_TRUE(advertisements.is_ok());
  ASSERT_NE(advertisements.value().get(), nullptr);
  EXPECT_EQ(advertisements.value()->status(),
            AdvertisementWatcherStatus::Created);
  EXPECT_EQ(advertisements.value()->scanning_mode(), ScanningMode::Active);

  auto query = platform->create_paired_query();
  ASSERT_TRUE(query.is_ok());
  EXPECT_NE(query.value().get(), nullptr);
}

TEST(BlueZPlatformTest, PassiveScanningIsNotSupported) {
  ScanConfig config;
  auto platform = make_bluez_platform(config);

  auto created = platform->create_advertisement_watcher();
  ASSERT_TRUE(created.is_ok());
  auto &watcher = created.value();

  watcher->set_scanning_mode(ScanningMode::Passive);
  auto started = watcher->start();
  ASSERT_TRUE(started.is_error());
  EXPECT_EQ(started.error().code, ErrorCode::NotSupported);
}
