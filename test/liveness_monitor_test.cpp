#include <gtest/gtest.h>
#include <main/console/liveness_monitor.hpp>

TEST(LivenessMonitorTest, NeverSeenIsOffline) {
    LivenessMonitor m(10000);
    EXPECT_EQ(m.displayedState(0), DeviceState::OFFLINE);
    EXPECT_FALSE(m.hasReported());
    // Nothing to announce for a device that never reported
    EXPECT_FALSE(m.checkWentOffline(50000));
}

TEST(LivenessMonitorTest, OfflineAtTimeoutBoundary) {
    LivenessMonitor m(10000);
    EXPECT_FALSE(m.onReport(DeviceState::NORMAL, 1000));
    EXPECT_EQ(m.displayedState(10999), DeviceState::NORMAL);
    EXPECT_EQ(m.displayedState(11000), DeviceState::OFFLINE);
}

// Three missed publish ticks past the timeout, then a WARNING envelope
TEST(LivenessMonitorTest, RecoversImmediatelyWithNewSeverity) {
    LivenessMonitor m(10000);
    m.onReport(DeviceState::NORMAL, 0);
    uint32_t silent_until = 10000 + 3 * 3000;
    EXPECT_EQ(m.displayedState(silent_until), DeviceState::OFFLINE);
    EXPECT_EQ(m.reportedState(), DeviceState::NORMAL);

    EXPECT_TRUE(m.onReport(DeviceState::WARNING, silent_until + 1));
    EXPECT_EQ(m.displayedState(silent_until + 1), DeviceState::WARNING);
}

TEST(LivenessMonitorTest, WentOfflineFiresOncePerSilence) {
    LivenessMonitor m(10000);
    m.onReport(DeviceState::EMERGENCY, 0);
    EXPECT_FALSE(m.checkWentOffline(9999));
    EXPECT_TRUE(m.checkWentOffline(10000));
    EXPECT_FALSE(m.checkWentOffline(10500));
    EXPECT_TRUE(m.onReport(DeviceState::EMERGENCY, 11000));
    EXPECT_TRUE(m.checkWentOffline(21000));
}

TEST(LivenessMonitorTest, OverlayDoesNotRewriteReportedState) {
    LivenessMonitor m(10000);
    m.onReport(DeviceState::SOS, 0);
    (void)m.checkWentOffline(20000);
    EXPECT_EQ(m.displayedState(20000), DeviceState::OFFLINE);
    EXPECT_EQ(m.reportedState(), DeviceState::SOS);
    EXPECT_EQ(m.lastReceiptMs(), 0u);
}
