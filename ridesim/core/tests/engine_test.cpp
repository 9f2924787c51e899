#include <ridesim/core/driver.hpp>
#include <ridesim/core/engine.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/notifier.hpp>
#include <ridesim/core/rider.hpp>
#include <ridesim/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

using namespace ridesim::core;

namespace {

class CountingNotifier : public Notifier {
public:
    void notify(TimePoint time, ActorKind kind, Action action,
                std::string_view id, Location /*location*/) override {
        log.push_back(std::to_string(time) + " " + std::string(to_string(kind)) + " " +
                      std::string(id) + " " + std::string(to_string(action)));
    }

    std::vector<std::string> log;
};

class TypeTraceWriter : public TraceWriter {
public:
    void begin(TimePoint time) override { current = std::to_string(time); }
    void type(std::string_view name) override { current += " " + std::string(name); }
    void field(std::string_view key, uint64_t value) override {
        current += " " + std::string(key) + "=" + std::to_string(value);
    }
    void field(std::string_view key, std::string_view value) override {
        current += " " + std::string(key) + "=" + std::string(value);
    }
    void end() override { records.push_back(current); }

    std::string current;
    std::vector<std::string> records;
};

} // anonymous namespace

class EngineTest : public ::testing::Test {
protected:
    CountingNotifier notifier_;
};

TEST_F(EngineTest, InitialState) {
    Engine engine(notifier_);

    EXPECT_EQ(engine.time(), 0U);
    EXPECT_EQ(engine.pending_events(), 0U);
    EXPECT_EQ(engine.processed_events(), 0U);
    EXPECT_EQ(engine.dispatcher().policy(), MatchPolicy::Reserve);
}

TEST_F(EngineTest, RunEmptyQueue) {
    Engine engine(notifier_);
    engine.run();

    EXPECT_EQ(engine.time(), 0U);
    EXPECT_TRUE(notifier_.log.empty());
}

TEST_F(EngineTest, AddAndFindEntities) {
    Engine engine(notifier_);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    auto& sam = engine.add_driver("Sam", {1, 1}, 2);

    EXPECT_EQ(engine.find_rider("xyz"), &xyz);
    EXPECT_EQ(engine.find_driver("Sam"), &sam);
    EXPECT_EQ(engine.find_rider("Sam"), nullptr);
    EXPECT_EQ(engine.find_driver("nobody"), nullptr);
    EXPECT_EQ(engine.rider_count(), 1U);
    EXPECT_EQ(engine.driver_count(), 1U);
}

TEST_F(EngineTest, DuplicateIdsRejected) {
    Engine engine(notifier_);
    engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.add_driver("Sam", {1, 1}, 2);

    EXPECT_THROW(engine.add_rider("xyz", {0, 0}, {1, 1}, 1), DuplicateIdError);
    EXPECT_THROW(engine.add_driver("Sam", {0, 0}, 1), DuplicateIdError);

    // Riders and drivers have separate namespaces
    EXPECT_NO_THROW(engine.add_driver("xyz", {0, 0}, 1));
}

TEST_F(EngineTest, RiderWithoutDriversCancels) {
    Engine engine(notifier_);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.schedule_rider_request(xyz, 0);

    engine.run();

    EXPECT_EQ(engine.time(), 4U);
    EXPECT_EQ(engine.processed_events(), 2U);
    EXPECT_EQ(xyz.status(), RiderStatus::Cancelled);
    EXPECT_TRUE(engine.dispatcher().is_cancelled("xyz"));
    EXPECT_EQ(notifier_.log, (std::vector<std::string>{
        "0 rider xyz request",
        "4 rider xyz cancel",
    }));
}

TEST_F(EngineTest, ImmediateMatchBeatsCancellation) {
    Engine engine(notifier_);
    auto& sam = engine.add_driver("Sam", {1, 1}, 2);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.schedule_driver_request(sam, 0);
    engine.schedule_rider_request(xyz, 1);

    engine.run();

    EXPECT_EQ(xyz.status(), RiderStatus::Satisfied);
    EXPECT_TRUE(engine.dispatcher().is_satisfied("xyz"));
    EXPECT_FALSE(engine.dispatcher().is_cancelled("xyz"));
    EXPECT_TRUE(sam.is_idle());
    EXPECT_EQ(sam.location(), (Location{6, 6}));
    EXPECT_TRUE(engine.dispatcher().is_idle("Sam"));

    EXPECT_EQ(notifier_.log, (std::vector<std::string>{
        "0 driver Sam request",
        "1 rider xyz request",
        "1 rider xyz pickup",
        "1 driver Sam pickup",
        "5 rider xyz cancel",
        "6 driver Sam dropoff",
        "6 driver Sam request",
    }));
    EXPECT_EQ(engine.processed_events(), 6U);
    EXPECT_EQ(engine.time(), 6U);
}

TEST_F(EngineTest, SameTimeRequestsFireInScheduleOrder) {
    Engine engine(notifier_);
    auto& sam = engine.add_driver("Sam", {0, 0}, 1);
    auto& a = engine.add_rider("a", {0, 0}, {0, 1}, 10);
    auto& b = engine.add_rider("b", {0, 0}, {0, 1}, 10);
    engine.schedule_rider_request(b, 0);
    engine.schedule_rider_request(a, 0);
    engine.schedule_driver_request(sam, 0);

    engine.run();

    // b asked first, so Sam drives b before a
    ASSERT_GE(notifier_.log.size(), 4U);
    EXPECT_EQ(notifier_.log[3], "0 rider b pickup");
    EXPECT_EQ(a.status(), RiderStatus::Satisfied);
    EXPECT_EQ(b.status(), RiderStatus::Satisfied);
}

TEST_F(EngineTest, DriverReachingCancelledRiderReturnsToIdle) {
    Engine engine(notifier_);
    auto& slow = engine.add_driver("slow", {0, 0}, 1);
    auto& xyz = engine.add_rider("xyz", {5, 5}, {6, 6}, 3);
    engine.schedule_driver_request(slow, 0);
    engine.schedule_rider_request(xyz, 0);

    engine.run();

    EXPECT_EQ(xyz.status(), RiderStatus::Cancelled);
    EXPECT_TRUE(slow.is_idle());
    EXPECT_EQ(slow.location(), (Location{5, 5}));
    EXPECT_TRUE(engine.dispatcher().is_idle("slow"));
    EXPECT_EQ(notifier_.log.back(), "10 driver slow request");
}

TEST_F(EngineTest, ReservePolicyNeverDoubleBooks) {
    Engine engine(notifier_, MatchPolicy::Reserve);
    auto& sam = engine.add_driver("Sam", {0, 0}, 1);
    auto& a = engine.add_rider("a", {0, 2}, {0, 4}, 100);
    auto& b = engine.add_rider("b", {0, 1}, {0, 3}, 100);
    engine.schedule_driver_request(sam, 0);
    engine.schedule_rider_request(a, 1);
    engine.schedule_rider_request(b, 1);

    EXPECT_NO_THROW(engine.run());
    EXPECT_EQ(a.status(), RiderStatus::Satisfied);
    EXPECT_EQ(b.status(), RiderStatus::Satisfied);
    EXPECT_EQ(engine.dispatcher().satisfied_count(), 2U);
}

TEST_F(EngineTest, KeepIdlePolicyReportsDoubleBooking) {
    Engine engine(notifier_, MatchPolicy::KeepIdle);
    auto& sam = engine.add_driver("Sam", {0, 0}, 1);
    auto& a = engine.add_rider("a", {0, 2}, {0, 4}, 100);
    auto& b = engine.add_rider("b", {0, 1}, {0, 3}, 100);
    engine.schedule_driver_request(sam, 0);
    engine.schedule_rider_request(a, 1);
    engine.schedule_rider_request(b, 1);

    // Sam is still listed as idle when b asks for a driver
    EXPECT_THROW(engine.run(), DoubleBookingError);
}

TEST_F(EngineTest, SecondRiderWhileOnlyDriverIsBusy) {
    auto schedule = [](Engine& engine) {
        auto& sam = engine.add_driver("Sam", {0, 0}, 1);
        engine.schedule_driver_request(sam, 0);
        engine.schedule_rider_request(engine.add_rider("a", {0, 2}, {0, 4}, 100), 1);
        engine.schedule_rider_request(engine.add_rider("b", {5, 5}, {6, 6}, 100), 2);
    };

    Engine keep_idle(notifier_, MatchPolicy::KeepIdle);
    schedule(keep_idle);
    try {
        keep_idle.run();
        FAIL() << "expected DoubleBookingError";
    } catch (const DoubleBookingError& e) {
        EXPECT_NE(std::string(e.what()).find("Driver Sam matched to rider b"), std::string::npos);
    }
    EXPECT_EQ(keep_idle.time(), 2U);

    CountingNotifier reserve_notifier;
    Engine reserve(reserve_notifier, MatchPolicy::Reserve);
    schedule(reserve);
    EXPECT_NO_THROW(reserve.run());

    // b waits for Sam to drop a off at (0,4) at t=5
    EXPECT_EQ(reserve.find_rider("a")->status(), RiderStatus::Satisfied);
    EXPECT_EQ(reserve.find_rider("b")->status(), RiderStatus::Satisfied);
    EXPECT_EQ(reserve.dispatcher().satisfied_count(), 2U);
    const auto& log = reserve_notifier.log;
    EXPECT_NE(std::find(log.begin(), log.end(), "5 driver Sam dropoff"), log.end());
    EXPECT_NE(std::find(log.begin(), log.end(), "11 rider b pickup"), log.end());
    EXPECT_NE(std::find(log.begin(), log.end(), "13 driver Sam dropoff"), log.end());
}

TEST_F(EngineTest, SecondDriverReachingSatisfiedRider) {
    Engine engine(notifier_, MatchPolicy::Reserve);
    auto& far = engine.add_driver("far", {0, 0}, 1);
    auto& near = engine.add_driver("near", {0, 9}, 1);
    auto& x = engine.add_rider("x", {0, 10}, {0, 12}, 100);
    engine.schedule_driver_request(far, 0);
    engine.schedule_rider_request(x, 1);
    // x is matched to far but still waiting, so near is sent too
    engine.schedule_driver_request(near, 2);

    EXPECT_NO_THROW(engine.run());

    EXPECT_EQ(x.status(), RiderStatus::Satisfied);
    EXPECT_EQ(engine.dispatcher().satisfied_count(), 1U);
    EXPECT_TRUE(engine.dispatcher().is_satisfied("x"));

    std::vector<std::string> dropoffs;
    std::copy_if(notifier_.log.begin(), notifier_.log.end(), std::back_inserter(dropoffs),
                 [](const std::string& entry) { return entry.ends_with(" dropoff"); });
    EXPECT_EQ(dropoffs, (std::vector<std::string>{"5 driver near dropoff", "13 driver far dropoff"}));
    EXPECT_TRUE(far.is_idle());
    EXPECT_TRUE(near.is_idle());
}

TEST_F(EngineTest, PatiencePastEndOfTimeThrows) {
    Engine engine(notifier_);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, UINT64_MAX);
    engine.schedule_rider_request(xyz, 1);

    try {
        engine.run();
        FAIL() << "expected InvalidStateError";
    } catch (const InvalidStateError& e) {
        EXPECT_NE(std::string(e.what()).find("Cancellation time overflows"), std::string::npos);
    }
}

TEST_F(EngineTest, RunUntilStopsBeforeLaterEvents) {
    Engine engine(notifier_);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.schedule_rider_request(xyz, 0);

    engine.run(3);

    EXPECT_EQ(engine.time(), 3U);
    EXPECT_EQ(engine.pending_events(), 1U);
    EXPECT_EQ(xyz.status(), RiderStatus::Waiting);

    engine.run(4);
    EXPECT_EQ(engine.pending_events(), 0U);
    EXPECT_EQ(xyz.status(), RiderStatus::Cancelled);
}

TEST_F(EngineTest, ScheduleInThePastThrows) {
    Engine engine(notifier_);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.run(10);

    EXPECT_THROW(engine.schedule_rider_request(xyz, 5), InvalidStateError);
}

TEST_F(EngineTest, TraceRecordsEveryEvent) {
    Engine engine(notifier_);
    TypeTraceWriter writer;
    engine.set_trace_writer(&writer);

    auto& sam = engine.add_driver("Sam", {1, 1}, 2);
    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.schedule_driver_request(sam, 0);
    engine.schedule_rider_request(xyz, 1);
    engine.run();

    EXPECT_EQ(writer.records, (std::vector<std::string>{
        "0 driver_request driver=Sam speed=2",
        "1 rider_request rider=xyz patience=4",
        "1 pickup rider=xyz driver=Sam",
        "5 cancellation rider=xyz",
        "6 dropoff rider=xyz driver=Sam",
        "6 driver_request driver=Sam speed=2",
        "6 sim_finished processed_events=6",
    }));
}

TEST_F(EngineTest, NoTraceWithoutWriter) {
    Engine engine(notifier_);
    TypeTraceWriter writer;
    engine.set_trace_writer(&writer);
    engine.set_trace_writer(nullptr);

    auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
    engine.schedule_rider_request(xyz, 0);
    engine.run();

    EXPECT_TRUE(writer.records.empty());
}
