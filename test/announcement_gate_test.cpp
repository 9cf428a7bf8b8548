#include <gtest/gtest.h>
#include <main/console/announcement_gate.hpp>

TEST(AnnouncementGateTest, QuietStatesAreNeverAnnounced) {
    AnnouncementGate gate;
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::NORMAL, 0));
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::OFFLINE, 100000));
}

TEST(AnnouncementGateTest, SameStateHeldWithinLockout) {
    AnnouncementGate gate(10000);
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::EMERGENCY, 1000));
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::EMERGENCY, 1500));
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::EMERGENCY, 10999));
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::EMERGENCY, 11000));
}

TEST(AnnouncementGateTest, StateChangeAnnouncesImmediately) {
    AnnouncementGate gate(10000);
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::WARNING, 0));
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::SOS, 500));
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::WARNING, 900));
}

TEST(AnnouncementGateTest, QuietStateDoesNotResetLockout) {
    AnnouncementGate gate(10000);
    EXPECT_TRUE(gate.shouldAnnounce(DeviceState::SOS, 0));
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::NORMAL, 1000));
    EXPECT_FALSE(gate.shouldAnnounce(DeviceState::SOS, 2000));
}
