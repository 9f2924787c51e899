#include <ridesim/io/monitor.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace ridesim::io;
using namespace ridesim::core;

class MonitorTest : public ::testing::Test {
protected:
    // One completed trip: driver abc picks up rider xyz and drops it off
    void record_single_trip() {
        monitor_.notify(0, ActorKind::Driver, Action::Request, "abc", {0, 0});
        monitor_.notify(3, ActorKind::Driver, Action::Pickup, "abc", {1, 1});
        monitor_.notify(6, ActorKind::Driver, Action::Dropoff, "abc", {5, 5});
        monitor_.notify(0, ActorKind::Rider, Action::Request, "xyz", {1, 1});
        monitor_.notify(3, ActorKind::Rider, Action::Pickup, "xyz", {1, 1});
    }

    Monitor monitor_;
};

TEST_F(MonitorTest, EmptyMonitor) {
    auto report = monitor_.report();

    EXPECT_FALSE(report.rider_wait_time.has_value());
    EXPECT_FALSE(report.driver_total_distance.has_value());
    EXPECT_FALSE(report.driver_ride_distance.has_value());
    EXPECT_EQ(monitor_.rider_count(), 0U);
    EXPECT_EQ(monitor_.driver_count(), 0U);
}

TEST_F(MonitorTest, SingleTripReport) {
    record_single_trip();

    auto report = monitor_.report();
    ASSERT_TRUE(report.rider_wait_time.has_value());
    ASSERT_TRUE(report.driver_total_distance.has_value());
    ASSERT_TRUE(report.driver_ride_distance.has_value());
    EXPECT_DOUBLE_EQ(*report.rider_wait_time, 3.0);
    EXPECT_DOUBLE_EQ(*report.driver_total_distance, 10.0);
    EXPECT_DOUBLE_EQ(*report.driver_ride_distance, 8.0);
}

TEST_F(MonitorTest, WaitTimeCountsCancellations) {
    record_single_trip();
    monitor_.notify(0, ActorKind::Rider, Action::Request, "ash", {1, 1});
    monitor_.notify(8, ActorKind::Rider, Action::Cancel, "ash", {1, 1});

    EXPECT_DOUBLE_EQ(*monitor_.report().rider_wait_time, 5.5);
}

TEST_F(MonitorTest, WaitTimeIgnoresRidersStillWaiting) {
    record_single_trip();
    monitor_.notify(4, ActorKind::Rider, Action::Request, "late", {1, 1});

    EXPECT_DOUBLE_EQ(*monitor_.report().rider_wait_time, 3.0);
}

TEST_F(MonitorTest, DistancesAcrossDrivers) {
    record_single_trip();
    monitor_.notify(6, ActorKind::Driver, Action::Request, "luigi", {2, 2});
    monitor_.notify(8, ActorKind::Driver, Action::Pickup, "luigi", {3, 3});
    monitor_.notify(145, ActorKind::Driver, Action::Dropoff, "luigi", {0, 0});

    auto report = monitor_.report();
    EXPECT_DOUBLE_EQ(*report.driver_total_distance, 9.0);
    EXPECT_DOUBLE_EQ(*report.driver_ride_distance, 7.0);
}

TEST_F(MonitorTest, RideDistanceAveragesOverAllDrivers) {
    record_single_trip();
    // Registered but never moved
    monitor_.notify(0, ActorKind::Driver, Action::Request, "idle", {9, 9});

    auto report = monitor_.report();
    EXPECT_DOUBLE_EQ(*report.driver_total_distance, 10.0);
    EXPECT_DOUBLE_EQ(*report.driver_ride_distance, 4.0);
}

TEST_F(MonitorTest, OnlyRequestsLeaveStatisticsEmpty) {
    monitor_.notify(0, ActorKind::Driver, Action::Request, "abc", {0, 0});
    monitor_.notify(0, ActorKind::Rider, Action::Request, "xyz", {1, 1});

    auto report = monitor_.report();
    EXPECT_FALSE(report.rider_wait_time.has_value());
    EXPECT_FALSE(report.driver_total_distance.has_value());
    ASSERT_TRUE(report.driver_ride_distance.has_value());
    EXPECT_DOUBLE_EQ(*report.driver_ride_distance, 0.0);
}

TEST_F(MonitorTest, ActivitiesPerActor) {
    record_single_trip();

    const auto& abc = monitor_.activities(ActorKind::Driver, "abc");
    ASSERT_EQ(abc.size(), 3U);
    EXPECT_EQ(abc[0].action, Action::Request);
    EXPECT_EQ(abc[2].action, Action::Dropoff);
    EXPECT_EQ(abc[2].time, 6U);
    EXPECT_EQ(abc[2].location, (Location{5, 5}));

    EXPECT_TRUE(monitor_.activities(ActorKind::Rider, "abc").empty());
    EXPECT_TRUE(monitor_.activities(ActorKind::Driver, "nobody").empty());
}

TEST_F(MonitorTest, StreamFormat) {
    std::ostringstream oss;
    oss << monitor_;
    EXPECT_EQ(oss.str(), "Monitor (0 drivers, 0 riders)");

    monitor_.notify(3, ActorKind::Driver, Action::Pickup, "abc", {1, 1});
    oss.str("");
    oss << monitor_;
    EXPECT_EQ(oss.str(), "Monitor (1 drivers, 0 riders)");
}

TEST_F(MonitorTest, WriteReportJson) {
    record_single_trip();

    std::ostringstream oss;
    write_report_to_stream(monitor_.report(), oss);
    EXPECT_EQ(oss.str(),
              "{\"rider_wait_time\":3.0,\"driver_total_distance\":10.0,\"driver_ride_distance\":8.0}\n");
}

TEST_F(MonitorTest, WriteReportJsonWithMissingStatistics) {
    std::ostringstream oss;
    write_report_to_stream(Report{}, oss);
    EXPECT_EQ(oss.str(),
              "{\"rider_wait_time\":null,\"driver_total_distance\":null,\"driver_ride_distance\":null}\n");
}
