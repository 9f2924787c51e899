#include <ridesim/core/driver.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/rider.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace ridesim::core;

class DriverTest : public ::testing::Test {
protected:
    Driver driver_{"Sam", {1, 1}, 2};
    Rider rider_{"xyz", {4, 4}, {6, 6}, 10};
};

TEST_F(DriverTest, StartsIdle) {
    EXPECT_EQ(driver_.id(), "Sam");
    EXPECT_EQ(driver_.location(), (Location{1, 1}));
    EXPECT_EQ(driver_.speed(), 2U);
    EXPECT_TRUE(driver_.is_idle());
    EXPECT_FALSE(driver_.destination().has_value());
}

TEST_F(DriverTest, TravelTime) {
    EXPECT_EQ(driver_.travel_time({6, 6}), 5U);
    EXPECT_EQ(driver_.travel_time({4, 4}), 3U);
}

TEST_F(DriverTest, FullTripCycle) {
    EXPECT_EQ(driver_.start_drive(rider_.origin()), 3U);
    EXPECT_FALSE(driver_.is_idle());
    EXPECT_EQ(driver_.destination(), rider_.origin());

    driver_.end_drive();
    EXPECT_EQ(driver_.location(), (Location{4, 4}));
    EXPECT_FALSE(driver_.destination().has_value());
    EXPECT_FALSE(driver_.is_idle());

    EXPECT_EQ(driver_.start_ride(rider_), 2U);
    EXPECT_EQ(driver_.destination(), rider_.destination());

    driver_.end_ride();
    EXPECT_EQ(driver_.location(), (Location{6, 6}));
    EXPECT_FALSE(driver_.destination().has_value());
    EXPECT_TRUE(driver_.is_idle());
}

TEST_F(DriverTest, ReleaseAfterPickup) {
    driver_.start_drive(rider_.origin());
    driver_.end_drive();

    driver_.release();
    EXPECT_TRUE(driver_.is_idle());
    EXPECT_EQ(driver_.location(), (Location{4, 4}));
    EXPECT_FALSE(driver_.destination().has_value());
}

TEST_F(DriverTest, StartDriveRequiresIdle) {
    driver_.start_drive(rider_.origin());
    EXPECT_THROW(driver_.start_drive({0, 0}), InvalidStateError);
}

TEST_F(DriverTest, EndDriveRequiresDestination) {
    EXPECT_THROW(driver_.end_drive(), InvalidStateError);
    EXPECT_THROW(driver_.end_ride(), InvalidStateError);
}

TEST_F(DriverTest, StartRideRequiresArrival) {
    // Idle driver
    EXPECT_THROW(driver_.start_ride(rider_), InvalidStateError);

    // Still en route
    driver_.start_drive(rider_.origin());
    EXPECT_THROW(driver_.start_ride(rider_), InvalidStateError);
    EXPECT_THROW(driver_.release(), InvalidStateError);
}

TEST_F(DriverTest, IdleDriverCannotBeReleased) {
    EXPECT_THROW(driver_.release(), InvalidStateError);
}

TEST_F(DriverTest, ZeroSpeed) {
    Driver parked{"p", {0, 0}, 0};
    EXPECT_EQ(parked.start_drive({9, 9}), 0U);
}

TEST_F(DriverTest, StreamFormat) {
    std::ostringstream oss;
    oss << driver_;
    EXPECT_EQ(oss.str(), "ID: Sam, Location: (1,1), Speed: 2");
}
