#include <gtest/gtest.h>
#include <main/console/location_trail.hpp>

TEST(LocationTrailTest, SkipsJitterBelowMinimumStep) {
    LocationTrail trail;
    EXPECT_TRUE(trail.add(53.3498, -6.2603));
    EXPECT_FALSE(trail.add(53.34985, -6.26025));
    EXPECT_EQ(trail.size(), 1u);
    EXPECT_TRUE(trail.add(53.3500, -6.2603));
    EXPECT_EQ(trail.size(), 2u);
}

TEST(LocationTrailTest, LongitudeStepAloneIsRecorded) {
    LocationTrail trail;
    trail.add(10.0, 20.0);
    EXPECT_TRUE(trail.add(10.0, 20.001));
    GeoPoint last{};
    ASSERT_TRUE(trail.newest(last));
    EXPECT_DOUBLE_EQ(last.longitude, 20.001);
}

TEST(LocationTrailTest, KeepsMostRecentPoints) {
    LocationTrail trail;
    for (int i = 0; i < 70; ++i) {
        trail.add(0.01 * i, 0.0);
    }
    ASSERT_EQ(trail.size(), LocationTrail::kCapacity);
    EXPECT_NEAR(trail.at(0).latitude, 0.20, 1e-9);
    EXPECT_NEAR(trail.at(trail.size() - 1).latitude, 0.69, 1e-9);
}
