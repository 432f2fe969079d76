#include <gtest/gtest.h>

#include "idleguard/rolling_window.hpp"

#include <QTimeZone>

using namespace idleguard;

namespace {
const QDateTime kStart = QDateTime::fromMSecsSinceEpoch(1700000000000LL, QTimeZone::utc());
} // namespace

TEST(RollingWindowTest, FirstReadingOnlySetsReference) {
    RollingWindowTotal window;
    window.addCounters(kStart, 5000000000ULL, 7000000000ULL);

    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 0.0);
    EXPECT_DOUBLE_EQ(window.totals().downloadBytes, 0.0);
    EXPECT_EQ(window.size(), 0u);
}

TEST(RollingWindowTest, AccumulatesDeltas) {
    RollingWindowTotal window;
    window.addCounters(kStart, 1000, 2000);
    window.addCounters(kStart.addSecs(3), 61000, 2500);
    window.addCounters(kStart.addSecs(6), 121000, 3000);

    const RollingTotals totals = window.totals();
    EXPECT_DOUBLE_EQ(totals.uploadBytes, 120000.0);
    EXPECT_DOUBLE_EQ(totals.downloadBytes, 1000.0);
    EXPECT_DOUBLE_EQ(totals.uploadMegabytes(), 0.12);
}

TEST(RollingWindowTest, OldDeltasAgeOut) {
    RollingWindowTotal window(60);
    window.addCounters(kStart, 0, 0);
    window.addCounters(kStart.addSecs(10), 1000000, 0);
    window.addCounters(kStart.addSecs(50), 3000000, 0);

    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 3000000.0);

    window.expire(kStart.addSecs(80));
    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 2000000.0);

    window.expire(kStart.addSecs(200));
    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 0.0);
    EXPECT_EQ(window.size(), 0u);
}

TEST(RollingWindowTest, CounterResetCountsNothing) {
    RollingWindowTotal window;
    window.addCounters(kStart, 5000, 5000);
    window.addCounters(kStart.addSecs(3), 6000, 6000);
    window.addCounters(kStart.addSecs(6), 100, 100);
    window.addCounters(kStart.addSecs(9), 600, 300);

    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 1500.0);
    EXPECT_DOUBLE_EQ(window.totals().downloadBytes, 1200.0);
}

TEST(RollingWindowTest, ClearForgetsReference) {
    RollingWindowTotal window;
    window.addCounters(kStart, 0, 0);
    window.addCounters(kStart.addSecs(1), 1000, 1000);
    window.clear();

    window.addCounters(kStart.addSecs(2), 50000, 50000);
    EXPECT_DOUBLE_EQ(window.totals().uploadBytes, 0.0);
}
