/**
 * @file test_types.cpp
 * @brief Unit tests for core types, address formatting and events
 */

#include <bluescan/event.h>
#include <bluescan/types.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace bluescan;

// ============================================================================
// Placeholder Names
// ============================================================================

TEST(PlaceholderNameTest, EmptyIsPlaceholder) {
  EXPECT_TRUE(is_placeholder_name(""));
}

TEST(PlaceholderNameTest, SentinelsArePlaceholders) {
  EXPECT_TRUE(is_placeholder_name(UNKNOWN_DEVICE_NAME));
  EXPECT_TRUE(is_placeholder_name(UNKNOWN_BLE_DEVICE_NAME));
  EXPECT_TRUE(is_placeholder_name("UNKNOWN"));
}

TEST(PlaceholderNameTest, RealNamesAreNot) {
  EXPECT_FALSE(is_placeholder_name("Speaker"));
  EXPECT_FALSE(is_placeholder_name("Known Device"));
}

// ============================================================================
// Bluetooth Addresses
// ============================================================================

TEST(BluetoothAddressTest, FormatsTwelveUppercaseHexDigits) {
  EXPECT_EQ(format_bluetooth_address(0xAABBCCDDEEFFULL), "AABBCCDDEEFF");
  EXPECT_EQ(format_bluetooth_address(0x1122), "000000001122");
  EXPECT_EQ(format_bluetooth_address(0), "000000000000");
}

TEST(BluetoothAddressTest, FormatIgnoresBitsAbove48) {
  EXPECT_EQ(format_bluetooth_address(0xFF00001122334455ULL), "001122334455");
}

TEST(BluetoothAddressTest, ParsesColonSeparated) {
  auto address = parse_bluetooth_address("AA:BB:cc:dd:EE:01");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(*address, 0xAABBCCDDEE01ULL);
}

TEST(BluetoothAddressTest, RejectsMalformed) {
  EXPECT_FALSE(parse_bluetooth_address("").has_value());
  EXPECT_FALSE(parse_bluetooth_address("AA:BB:CC:DD:EE").has_value());
  EXPECT_FALSE(parse_bluetooth_address("AA-BB-CC-DD-EE-FF").has_value());
  EXPECT_FALSE(parse_bluetooth_address("AA:BB:CC:DD:EE:GG").has_value());
}

TEST(SignalStatusTest, Format) {
  EXPECT_EQ(format_signal_status(-62), "Signal: -62 dBm");
  EXPECT_EQ(format_signal_status(0), "Signal: 0 dBm");
}

// ============================================================================
// Observations
// ============================================================================

TEST(ObservationTest, Builders) {
  auto upsert = Observation::upsert("id", "Name", STATUS_AVAILABLE);
  EXPECT_EQ(upsert.kind, Observation::Kind::Upsert);
  EXPECT_EQ(upsert.name, "Name");

  auto update = Observation::status_update("id", STATUS_CONNECTED);
  EXPECT_EQ(update.kind, Observation::Kind::StatusUpdate);
  EXPECT_TRUE(update.name.empty());
  EXPECT_EQ(update.status, STATUS_CONNECTED);
}

// ============================================================================
// Event
// ============================================================================

TEST(EventTest, EmitReachesAllHandlers) {
  Event<int> event;
  std::vector<int> seen;

  event += [&](int v) { seen.push_back(v); };
  event += [&](int v) { seen.push_back(v * 10); };
  event.emit(3);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], 3);
  EXPECT_EQ(seen[1], 30);
}

TEST(EventTest, RemovedHandlerIsNotCalled) {
  Event<> event;
  int calls = 0;

  auto token = event.add([&] { ++calls; });
  EXPECT_EQ(event.size(), 1u);
  EXPECT_TRUE(event.remove(token));
  EXPECT_FALSE(event.remove(token));
  EXPECT_TRUE(event.empty());

  event.emit();
  EXPECT_EQ(calls, 0);
}

TEST(EventTest, TokensAreDistinct) {
  Event<const std::string &> event;
  auto first = event.add([](const std::string &) {});
  auto second = event.add([](const std::string &) {});
  EXPECT_NE(first, second);

  event.clear();
  EXPECT_TRUE(event.empty());
}
