#include <gtest/gtest.h>
#include "ferry/transfer/progress_meter.hpp"
#include <cmath>

using namespace ferry::transfer;
using namespace std::chrono_literals;

class ProgressMeterTest : public ::testing::Test {
protected:
    TimePoint t0 = TimePoint(std::chrono::hours(24 * 365 * 50));
};

TEST_F(ProgressMeterTest, ReportedSpeedWins) {
    ProgressMeter meter;
    meter.start(t0);
    meter.record(t0 + 500ms, 1000, 4000.0);
    
    EXPECT_DOUBLE_EQ(meter.current_speed(), 4000.0);
    EXPECT_DOUBLE_EQ(meter.peak_speed(), 4000.0);
    EXPECT_DOUBLE_EQ(meter.average_speed(), 2000.0);
}

TEST_F(ProgressMeterTest, WindowSpeedWhenNotReported) {
    ProgressMeter meter;
    meter.start(t0);
    meter.record(t0 + 200ms, 300, 0.0);
    meter.record(t0 + 400ms, 200, 0.0);
    
    EXPECT_DOUBLE_EQ(meter.current_speed(), 500.0);
    EXPECT_EQ(meter.bytes_moved(), 500u);
    
    // Older samples fall out of the one second window
    meter.record(t0 + 1900ms, 100, 0.0);
    EXPECT_DOUBLE_EQ(meter.current_speed(), 100.0);
}

TEST_F(ProgressMeterTest, PeakIsMonotonic) {
    ProgressMeter meter;
    meter.start(t0);
    meter.record(t0 + 1s, 100, 9000.0);
    meter.record(t0 + 2s, 100, 10.0);
    
    EXPECT_DOUBLE_EQ(meter.current_speed(), 10.0);
    EXPECT_DOUBLE_EQ(meter.peak_speed(), 9000.0);
}

TEST_F(ProgressMeterTest, Eta) {
    ProgressMeter meter;
    EXPECT_TRUE(std::isinf(meter.eta(100)));
    EXPECT_DOUBLE_EQ(meter.eta(0), 0.0);
    
    meter.start(t0);
    meter.record(t0 + 1s, 100, 50.0);
    EXPECT_DOUBLE_EQ(meter.eta(500), 10.0);
}

TEST_F(ProgressMeterTest, ActiveTimeExcludesStoppedPeriods) {
    ProgressMeter meter;
    meter.start(t0);
    meter.stop(t0 + 2s);
    EXPECT_FALSE(meter.running());
    EXPECT_DOUBLE_EQ(meter.current_speed(), 0.0);
    
    meter.start(t0 + 10s);
    EXPECT_TRUE(meter.running());
    EXPECT_EQ(meter.active_time(t0 + 13s), std::chrono::milliseconds(5000));
}
