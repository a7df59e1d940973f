/**
 * @file test_intake.cpp
 * @brief Unit tests for the serialized observation intake
 */

#include <bluescan/intake.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace bluescan;

TEST(ObservationIntakeTest, AppliesUpserts) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  EXPECT_TRUE(intake.post(Observation::upsert("AA:BB", "Speaker", STATUS_PAIRED)));
  intake.drain();

  auto record = store.find("AA:BB");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->name, "Speaker");
  EXPECT_EQ(intake.applied_count(), 1u);
}

TEST(ObservationIntakeTest, AppliesInPostOrder) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  intake.post(Observation::upsert("a", "A", STATUS_AVAILABLE));
  intake.post(Observation::upsert("b", "B", STATUS_AVAILABLE));
  intake.post(Observation::status_update("a", STATUS_CONNECTED));
  intake.post(Observation::upsert("c", "C", STATUS_AVAILABLE));
  intake.drain();

  auto records = store.snapshot();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].id, "a");
  EXPECT_EQ(records[0].status, STATUS_CONNECTED);
  EXPECT_EQ(records[1].id, "b");
  EXPECT_EQ(records[2].id, "c");
}

TEST(ObservationIntakeTest, StaleStatusUpdateIsDropped) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  intake.post(Observation::status_update("EE:FF", STATUS_CONNECTED));
  intake.drain();

  EXPECT_TRUE(store.empty());
  EXPECT_EQ(intake.applied_count(), 1u);
}

TEST(ObservationIntakeTest, SinkPostsToIntake) {
  DeviceRecordStore store;
  ObservationIntake intake(store);
  ObservationSink sink = intake.sink();

  EXPECT_TRUE(sink(Observation::upsert("x", "X", STATUS_AVAILABLE)));
  intake.drain();
  EXPECT_EQ(store.size(), 1u);
}

TEST(ObservationIntakeTest, PostAfterCloseIsRejected) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  intake.close();
  EXPECT_TRUE(intake.is_closed());
  EXPECT_FALSE(intake.post(Observation::upsert("x", "X", STATUS_AVAILABLE)));

  intake.drain();
  EXPECT_TRUE(store.empty());
}

TEST(ObservationIntakeTest, CloseAppliesQueuedObservations) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  for (int i = 0; i < 100; ++i) {
    intake.post(Observation::upsert(std::to_string(i), "D", STATUS_AVAILABLE));
  }
  intake.close();

  EXPECT_EQ(store.size(), 100u);
}

TEST(ObservationIntakeTest, CloseIsIdempotent) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  intake.close();
  intake.close();
  EXPECT_TRUE(intake.is_closed());
}

TEST(ObservationIntakeTest, ConcurrentProducersAreSerialized) {
  DeviceRecordStore store;
  ObservationIntake intake(store);
  constexpr int PER_PRODUCER = 300;

  auto producer = [&intake](const std::string &prefix) {
    for (int i = 0; i < PER_PRODUCER; ++i) {
      intake.post(Observation::upsert(prefix + std::to_string(i), "D",
                                      STATUS_AVAILABLE));
      intake.post(Observation::upsert("shared", "Shared",
                                      format_signal_status(-i)));
    }
  };

  std::vector<std::thread> producers;
  producers.emplace_back(producer, "classic-");
  producers.emplace_back(producer, "ble-");
  for (auto &t : producers) {
    t.join();
  }
  intake.drain();

  EXPECT_EQ(store.size(), static_cast<size_t>(2 * PER_PRODUCER + 1));
  EXPECT_EQ(intake.applied_count(), static_cast<uint64_t>(4 * PER_PRODUCER));
}

TEST(ObservationIntakeTest, DrainWithNothingPostedReturns) {
  DeviceRecordStore store;
  ObservationIntake intake(store);

  intake.drain();
  EXPECT_EQ(intake.applied_count(), 0u);
}
