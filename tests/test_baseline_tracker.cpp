#include <gtest/gtest.h>

#include "idleguard/baseline_tracker.hpp"

#include <limits>

using namespace idleguard;

TEST(BaselineTrackerTest, ColdStartIsRunningMean) {
    BaselineTracker tracker(4, 0.1);

    tracker.observe(100.0, 10.0, 2.0);
    tracker.observe(300.0, 30.0, 4.0);

    const Baseline b = tracker.baseline();
    EXPECT_DOUBLE_EQ(b.uploadBytesPerSecond, 200.0);
    EXPECT_DOUBLE_EQ(b.downloadBytesPerSecond, 20.0);
    EXPECT_DOUBLE_EQ(b.cpuPercent, 3.0);
    EXPECT_EQ(b.sampleCount, 2);
    EXPECT_FALSE(b.warm);
}

TEST(BaselineTrackerTest, SwitchesToEmaWhenWarm) {
    BaselineTracker tracker(2, 0.5);

    tracker.observe(100.0, 0.0, 0.0);
    tracker.observe(100.0, 0.0, 0.0);
    ASSERT_TRUE(tracker.isWarm());

    tracker.observe(300.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(tracker.baseline().uploadBytesPerSecond, 200.0);
}

TEST(BaselineTrackerTest, ConvergesToRepeatedSample) {
    BaselineTracker tracker;

    tracker.observe(50000.0, 50000.0, 90.0);
    for (int i = 0; i < 200; ++i) {
        tracker.observe(1200.0, 800.0, 3.5);
    }

    const Baseline b = tracker.baseline();
    EXPECT_TRUE(b.warm);
    EXPECT_NEAR(b.uploadBytesPerSecond, 1200.0, 1e-3);
    EXPECT_NEAR(b.downloadBytesPerSecond, 800.0, 1e-3);
    EXPECT_NEAR(b.cpuPercent, 3.5, 1e-6);
}

TEST(BaselineTrackerTest, IgnoresNonFiniteInput) {
    BaselineTracker tracker;
    tracker.observe(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0);
    tracker.observe(0.0, std::numeric_limits<double>::infinity(), 0.0);

    EXPECT_EQ(tracker.sampleCount(), 0);
    EXPECT_DOUBLE_EQ(tracker.baseline().uploadBytesPerSecond, 0.0);
}
