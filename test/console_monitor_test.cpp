#include <gtest/gtest.h>
#include <main/console/console_monitor.hpp>
#include <cstdio>
#include <memory>

namespace {
    TelemetryReport reportFor(const char* id, DeviceState state, uint8_t causes = CAUSE_NONE) {
        TelemetryReport r{};
        std::snprintf(r.device_id, sizeof(r.device_id), "%s", id);
        r.has_state = true;
        r.state = state;
        r.causes = causes;
        return r;
    }

    class ConsoleMonitorTest : public ::testing::Test {
    protected:
        // Device table is large; keep it off the test stack
        std::unique_ptr<ConsoleMonitor> monitor = std::make_unique<ConsoleMonitor>();
    };
}

TEST_F(ConsoleMonitorTest, RejectsEmptyDeviceId) {
    TelemetryReport r{};
    EXPECT_EQ(monitor->accept(r, 0), ConsoleMonitor::AcceptResult::INVALID);
    EXPECT_EQ(monitor->deviceCount(), 0u);
}

TEST_F(ConsoleMonitorTest, UnknownDeviceIsOffline) {
    EXPECT_EQ(monitor->displayedState("nobody", 0), DeviceState::OFFLINE);
}

TEST_F(ConsoleMonitorTest, NormalReportsDoNotAlert) {
    EXPECT_EQ(monitor->accept(reportFor("w1", DeviceState::NORMAL), 0),
              ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->accept(reportFor("w1", DeviceState::NORMAL), 3000),
              ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_TRUE(monitor->alerts().isEmpty());
    EXPECT_EQ(monitor->displayedState("w1", 3000), DeviceState::NORMAL);
}

TEST_F(ConsoleMonitorTest, AlertsOnTransitionIntoWarningOrWorse) {
    monitor->accept(reportFor("w1", DeviceState::NORMAL), 0, "08:00:00");
    monitor->accept(reportFor("w1", DeviceState::WARNING, CAUSE_STILL_WARNING), 3000, "08:00:03");
    monitor->accept(reportFor("w1", DeviceState::WARNING, CAUSE_STILL_WARNING), 6000, "08:00:06");
    monitor->accept(reportFor("w1", DeviceState::EMERGENCY, CAUSE_TEMP_CRITICAL | CAUSE_STILL_EMERGENCY),
                    9000, "08:00:09");

    const AlertLog& log = monitor->alerts();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.newestFirst(1).state, DeviceState::WARNING);
    EXPECT_STREQ(log.newestFirst(1).cause, "No movement detected");
    EXPECT_STREQ(log.newestFirst(1).clock, "08:00:03");
    EXPECT_EQ(log.newestFirst(0).state, DeviceState::EMERGENCY);
    EXPECT_STREQ(log.newestFirst(0).cause, "High temperature, no movement");
}

TEST_F(ConsoleMonitorTest, FirstReportAlreadyInAlarmIsLogged) {
    monitor->accept(reportFor("w1", DeviceState::SOS, CAUSE_SOS), 0);
    ASSERT_EQ(monitor->alerts().size(), 1u);
    EXPECT_STREQ(monitor->alerts().newestFirst(0).cause, "SOS signal received");
}

TEST_F(ConsoleMonitorTest, CauseTextFallsBackToSensorFailure) {
    TelemetryReport r = reportFor("w1", DeviceState::WARNING);
    r.has_health = true;
    r.sensors_ok = false;
    EXPECT_STREQ(ConsoleMonitor::causeText(r, DeviceState::WARNING), "Sensor failure");
    r.sensors_ok = true;
    EXPECT_STREQ(ConsoleMonitor::causeText(r, DeviceState::WARNING), "Status changed to WARNING");
}

TEST_F(ConsoleMonitorTest, SilenceAndResumeAreLogged) {
    monitor->accept(reportFor("w1", DeviceState::NORMAL), 0);
    monitor->tick(9999);
    EXPECT_TRUE(monitor->alerts().isEmpty());

    monitor->tick(10000);
    monitor->tick(12000);
    ASSERT_EQ(monitor->alerts().size(), 1u);
    EXPECT_EQ(monitor->alerts().newestFirst(0).state, DeviceState::OFFLINE);
    EXPECT_STREQ(monitor->alerts().newestFirst(0).cause, "No telemetry received");
    EXPECT_EQ(monitor->displayedState("w1", 12000), DeviceState::OFFLINE);

    monitor->accept(reportFor("w1", DeviceState::WARNING, CAUSE_TEMP_HIGH), 19000);
    EXPECT_EQ(monitor->displayedState("w1", 19000), DeviceState::WARNING);
    ASSERT_EQ(monitor->alerts().size(), 3u);
    EXPECT_STREQ(monitor->alerts().newestFirst(1).cause, "Telemetry resumed");
    EXPECT_STREQ(monitor->alerts().newestFirst(0).cause, "High temperature");
}

TEST_F(ConsoleMonitorTest, HeartbeatKeepsLastKnownState) {
    monitor->accept(reportFor("w1", DeviceState::WARNING, CAUSE_TEMP_HIGH), 0);
    TelemetryReport heartbeat{};
    std::snprintf(heartbeat.device_id, sizeof(heartbeat.device_id), "w1");
    EXPECT_EQ(monitor->accept(heartbeat, 8000), ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->displayedState("w1", 17000), DeviceState::WARNING);
    EXPECT_EQ(monitor->alerts().size(), 1u);
}

TEST_F(ConsoleMonitorTest, DuplicateRefreshesLivenessOnly) {
    TelemetryReport r = reportFor("w1", DeviceState::NORMAL);
    r.has_device_ts = true;
    r.device_ts_ms = 42000;
    r.temperature_valid = true;
    r.temperature_c = 31.0f;

    EXPECT_EQ(monitor->accept(r, 0), ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->accept(r, 9000), ConsoleMonitor::AcceptResult::DUPLICATE);
    EXPECT_EQ(monitor->displayedState("w1", 18000), DeviceState::NORMAL);

    ConsoleMonitor::DeviceView view{};
    ASSERT_TRUE(monitor->find("w1", view));
    EXPECT_EQ(view.analytics->temperatures().size(), 1u);
}

TEST_F(ConsoleMonitorTest, TracksPositionsPerDevice) {
    TelemetryReport a = reportFor("a", DeviceState::NORMAL);
    a.has_position = true;
    a.latitude = 1.0;
    a.longitude = 2.0;
    TelemetryReport b = reportFor("b", DeviceState::NORMAL);
    monitor->accept(a, 0);
    monitor->accept(b, 0);

    ConsoleMonitor::DeviceView view{};
    ASSERT_TRUE(monitor->find("a", view));
    EXPECT_EQ(view.trail->size(), 1u);
    ASSERT_TRUE(monitor->device(1, view));
    EXPECT_STREQ(view.device_id, "b");
    EXPECT_EQ(view.trail->size(), 0u);
    EXPECT_FALSE(monitor->device(2, view));
}

TEST_F(ConsoleMonitorTest, DeviceTableIsBounded) {
    char id[8];
    for (std::size_t i = 0; i < Config::Console::max_devices; ++i) {
        std::snprintf(id, sizeof(id), "d%zu", i);
        EXPECT_EQ(monitor->accept(reportFor(id, DeviceState::NORMAL), 0),
                  ConsoleMonitor::AcceptResult::ACCEPTED);
    }
    EXPECT_EQ(monitor->accept(reportFor("late", DeviceState::NORMAL), 0),
              ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL);
    // Known devices keep reporting
    EXPECT_EQ(monitor->accept(reportFor("d0", DeviceState::WARNING), 100),
              ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->deviceCount(), Config::Console::max_devices);
}

TEST_F(ConsoleMonitorTest, AnnouncesAlarmStatesWithLockout) {
    monitor->accept(reportFor("w1", DeviceState::EMERGENCY, CAUSE_TEMP_CRITICAL), 0);
    DeviceState announced = DeviceState::NORMAL;
    EXPECT_TRUE(monitor->shouldAnnounce(0, 0, announced));
    EXPECT_EQ(announced, DeviceState::EMERGENCY);
    EXPECT_FALSE(monitor->shouldAnnounce(0, 500, announced));
    EXPECT_FALSE(monitor->shouldAnnounce(3, 500, announced));
}

TEST_F(ConsoleMonitorTest, NinthDeviceTakesLongestSilentOfflineSlot) {
    char id[8];
    monitor->accept(reportFor("d0", DeviceState::NORMAL), 0);
    for (std::size_t i = 1; i < Config::Console::max_devices; ++i) {
        std::snprintf(id, sizeof(id), "d%zu", i);
        monitor->accept(reportFor(id, DeviceState::NORMAL), 5000);
    }

    EXPECT_EQ(monitor->accept(reportFor("dev8", DeviceState::SOS, CAUSE_SOS), 11000),
              ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->displayedState("dev8", 11000), DeviceState::SOS);
    EXPECT_EQ(monitor->deviceCount(), Config::Console::max_devices);
    EXPECT_EQ(monitor->evictedCount(), 1u);

    ConsoleMonitor::DeviceView view{};
    EXPECT_FALSE(monitor->find("d0", view));
    EXPECT_TRUE(monitor->find("d1", view));
    EXPECT_STREQ(monitor->alerts().newestFirst(0).cause, "SOS signal received");
}

TEST_F(ConsoleMonitorTest, ReserveRefusesWhenEveryDeviceIsLive) {
    char id[8];
    for (std::size_t i = 0; i < Config::Console::max_devices; ++i) {
        std::snprintf(id, sizeof(id), "d%zu", i);
        monitor->accept(reportFor(id, DeviceState::NORMAL), 0);
    }
    EXPECT_EQ(monitor->reserve("late", 9999), ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL);
    EXPECT_EQ(monitor->reserve("d3", 9999), ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->reserve("", 9999), ConsoleMonitor::AcceptResult::INVALID);
    EXPECT_EQ(monitor->evictedCount(), 0u);

    // Once d0..d7 fall silent the newcomer gets a slot
    EXPECT_EQ(monitor->reserve("late", 10000), ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->evictedCount(), 1u);
}

TEST_F(ConsoleMonitorTest, ReservedSlotIsKeptForItsReport) {
    char id[8];
    for (std::size_t i = 0; i + 1 < Config::Console::max_devices; ++i) {
        std::snprintf(id, sizeof(id), "d%zu", i);
        monitor->accept(reportFor(id, DeviceState::NORMAL), 0);
    }
    ASSERT_EQ(monitor->reserve("new", 100), ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->deviceCount(), Config::Console::max_devices);
    EXPECT_EQ(monitor->displayedState("new", 100), DeviceState::OFFLINE);
    EXPECT_EQ(monitor->reserve("other", 5000), ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL);

    EXPECT_EQ(monitor->accept(reportFor("new", DeviceState::EMERGENCY, CAUSE_TEMP_CRITICAL), 200),
              ConsoleMonitor::AcceptResult::ACCEPTED);
    EXPECT_EQ(monitor->displayedState("new", 200), DeviceState::EMERGENCY);
}

TEST_F(ConsoleMonitorTest, UnclaimedReservationExpires) {
    char id[8];
    for (std::size_t i = 0; i + 1 < Config::Console::max_devices; ++i) {
        std::snprintf(id, sizeof(id), "d%zu", i);
        monitor->accept(reportFor(id, DeviceState::NORMAL), 9000);
    }
    ASSERT_EQ(monitor->reserve("ghost", 100), ConsoleMonitor::AcceptResult::ACCEPTED);

    EXPECT_EQ(monitor->reserve("other", 10099), ConsoleMonitor::AcceptResult::DEVICE_TABLE_FULL);
    EXPECT_EQ(monitor->reserve("other", 10100), ConsoleMonitor::AcceptResult::ACCEPTED);
    ConsoleMonitor::DeviceView view{};
    EXPECT_FALSE(monitor->find("ghost", view));
    EXPECT_TRUE(monitor->find("other", view));
}

TEST_F(ConsoleMonitorTest, RepeatedTimestampWithNewReadingsIsKept) {
    TelemetryReport r = reportFor("w1", DeviceState::NORMAL);
    r.has_device_ts = true;
    r.device_ts_ms = 3000;
    r.temperature_valid = true;
    r.temperature_c = 31.0f;
    EXPECT_EQ(monitor->accept(r, 0), ConsoleMonitor::AcceptResult::ACCEPTED);

    // Rebooted device reusing an uptime value
    r.temperature_c = 29.5f;
    EXPECT_EQ(monitor->accept(r, 3000), ConsoleMonitor::AcceptResult::ACCEPTED);

    ConsoleMonitor::DeviceView view{};
    ASSERT_TRUE(monitor->find("w1", view));
    EXPECT_EQ(view.analytics->temperatures().size(), 2u);
}
