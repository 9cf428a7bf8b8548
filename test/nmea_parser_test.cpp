#include <gtest/gtest.h>
#include <main/hardware/nmea_parser.hpp>
#include <cstdio>
#include <cstring>
#include <string>

namespace {
    const char* kFix = "$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47";

    // Frames "GNGGA,..." as "$GNGGA,...*hh"
    std::string sentence(const std::string& body) {
        unsigned sum = 0;
        for (char c : body) sum ^= static_cast<unsigned char>(c);
        char tail[4];
        std::snprintf(tail, sizeof(tail), "*%02X", sum & 0xFFU);
        return "$" + body + tail;
    }

    NmeaParser::Result parse(const std::string& s, GpsFix& out) {
        return NmeaParser::parseSentence(s.c_str(), s.size(), out);
    }
}

TEST(NmeaParserTest, DecodesGgaFix) {
    GpsFix fix;
    ASSERT_EQ(NmeaParser::parseSentence(kFix, std::strlen(kFix), fix), NmeaParser::Result::FIX);
    EXPECT_NEAR(fix.latitude, 48.1173, 1e-6);
    EXPECT_NEAR(fix.longitude, 11.516667, 1e-6);
    EXPECT_EQ(fix.satellites, 8);
}

TEST(NmeaParserTest, SouthAndWestAreNegative) {
    GpsFix fix;
    ASSERT_EQ(parse(sentence("GNGGA,101010,3351.000,S,15112.000,W,1,05,1.2,10.0,M,0.0,M,,"), fix),
              NmeaParser::Result::FIX);
    EXPECT_NEAR(fix.latitude, -33.85, 1e-9);
    EXPECT_NEAR(fix.longitude, -151.2, 1e-9);
}

TEST(NmeaParserTest, RejectsBadChecksum) {
    std::string broken(kFix);
    broken[broken.size() - 1] = '8';
    GpsFix fix;
    fix.latitude = 1.0;
    EXPECT_EQ(parse(broken, fix), NmeaParser::Result::BAD_CHECKSUM);
    EXPECT_DOUBLE_EQ(fix.latitude, 1.0);
}

TEST(NmeaParserTest, QualityZeroIsNoFix) {
    GpsFix fix;
    EXPECT_EQ(parse(sentence("GPGGA,123519,,,,,0,00,,,M,,M,,"), fix), NmeaParser::Result::NO_FIX);
    EXPECT_EQ(parse(sentence("GPGGA,123519,4807.038,N,01131.000,E,0,03,0.9,545.4,M,46.9,M,,"), fix),
              NmeaParser::Result::NO_FIX);
}

TEST(NmeaParserTest, MalformedCoordinatesAreNoFix) {
    GpsFix fix;
    EXPECT_EQ(parse(sentence("GPGGA,123519,4861.000,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,"), fix),
              NmeaParser::Result::NO_FIX);
    EXPECT_EQ(parse(sentence("GPGGA,123519,4807.038,X,01131.000,E,1,08,0.9,545.4,M,46.9,M,,"), fix),
              NmeaParser::Result::NO_FIX);
}

TEST(NmeaParserTest, IgnoresOtherSentences) {
    GpsFix fix;
    EXPECT_EQ(parse(sentence("GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W"), fix),
              NmeaParser::Result::NONE);
}

TEST(NmeaParserTest, FeedAssemblesAcrossNoise) {
    NmeaParser parser;
    GpsFix fix;
    std::string stream = std::string("garbage\r\n") +
                         sentence("GPGSV,1,1,00") + "\r\n" + kFix + "\r\n";
    int fixes = 0;
    for (char c : stream) {
        if (parser.feed(c, fix) == NmeaParser::Result::FIX) {
            ++fixes;
        }
    }
    EXPECT_EQ(fixes, 1);
    EXPECT_NEAR(fix.latitude, 48.1173, 1e-6);
}

TEST(NmeaParserTest, OverlongLineIsDiscarded) {
    NmeaParser parser;
    GpsFix fix;
    parser.feed('$', fix);
    for (size_t i = 0; i < NmeaParser::kMaxSentence + 10; ++i) {
        EXPECT_EQ(parser.feed('A', fix), NmeaParser::Result::NONE);
    }
    EXPECT_EQ(parser.feed('\n', fix), NmeaParser::Result::NONE);
    for (const char* p = kFix; *p; ++p) parser.feed(*p, fix);
    EXPECT_EQ(parser.feed('\r', fix), NmeaParser::Result::FIX);
}
