#include <gtest/gtest.h>
#include <main/models/device_status.hpp>

TEST(DeviceStatusTest, ParsesBareNames) {
    DeviceState s = DeviceState::OFFLINE;
    ASSERT_TRUE(DeviceStatus::parse("NORMAL", s));
    EXPECT_EQ(s, DeviceState::NORMAL);
    ASSERT_TRUE(DeviceStatus::parse("SOS", s));
    EXPECT_EQ(s, DeviceState::SOS);
}

TEST(DeviceStatusTest, ParsesByPrefixWithSuffix) {
    DeviceState s = DeviceState::NORMAL;
    ASSERT_TRUE(DeviceStatus::parse("EMERGENCY (HIGH TEMP)", s));
    EXPECT_EQ(s, DeviceState::EMERGENCY);
    ASSERT_TRUE(DeviceStatus::parse("  WARNING (NO MOVEMENT)", s));
    EXPECT_EQ(s, DeviceState::WARNING);
    ASSERT_TRUE(DeviceStatus::parse("WARNING: stillness", s));
    EXPECT_EQ(s, DeviceState::WARNING);
}

TEST(DeviceStatusTest, RejectsUnknownAndOffline) {
    DeviceState s = DeviceState::NORMAL;
    EXPECT_FALSE(DeviceStatus::parse("PANIC", s));
    EXPECT_FALSE(DeviceStatus::parse("NORMALISH", s));
    EXPECT_FALSE(DeviceStatus::parse("OFFLINE", s));
    EXPECT_FALSE(DeviceStatus::parse("", s));
    EXPECT_FALSE(DeviceStatus::parse(nullptr, s));
}

TEST(DeviceStatusTest, MaxSeverityFollowsOrdering) {
    EXPECT_EQ(DeviceStatus::maxSeverity(DeviceState::WARNING, DeviceState::EMERGENCY), DeviceState::EMERGENCY);
    EXPECT_EQ(DeviceStatus::maxSeverity(DeviceState::SOS, DeviceState::NORMAL), DeviceState::SOS);
    EXPECT_TRUE(DeviceStatus::atLeast(DeviceState::EMERGENCY, DeviceState::WARNING));
    EXPECT_FALSE(DeviceStatus::atLeast(DeviceState::NORMAL, DeviceState::WARNING));
}

TEST(DeviceStatusTest, CauseSuffixMatchesTier) {
    char out[32];
    DeviceStatus::formatCauseSuffix(DeviceState::EMERGENCY, CAUSE_TEMP_CRITICAL, out, sizeof(out));
    EXPECT_STREQ(out, "HIGH TEMP");

    DeviceStatus::formatCauseSuffix(DeviceState::WARNING, CAUSE_TEMP_HIGH | CAUSE_STILL_WARNING, out, sizeof(out));
    EXPECT_STREQ(out, "HIGH TEMP + NO MOVEMENT");

    // A warning-tier cause does not label an emergency
    DeviceStatus::formatCauseSuffix(DeviceState::EMERGENCY, CAUSE_STILL_EMERGENCY | CAUSE_TEMP_HIGH, out, sizeof(out));
    EXPECT_STREQ(out, "NO MOVEMENT");

    DeviceStatus::formatCauseSuffix(DeviceState::SOS, CAUSE_SOS | CAUSE_TEMP_CRITICAL, out, sizeof(out));
    EXPECT_STREQ(out, "");
}
