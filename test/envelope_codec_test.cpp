#include <gtest/gtest.h>
#include <main/telemetry/envelope_codec.hpp>
#include <cstdio>
#include <cstring>
#include <string>

namespace {
    TelemetryEnvelope baseEnvelope() {
        TelemetryEnvelope env{};
        std::snprintf(env.device_id, sizeof(env.device_id), "%s", "wearer-07");
        env.state = DeviceState::NORMAL;
        env.causes = CAUSE_NONE;
        env.temperature_c = 31.5f;
        env.temperature_valid = true;
        env.total_acc_g = 1.02f;
        env.moving = true;
        env.health = SubsystemHealth{};
        env.latitude = 53.349805;
        env.longitude = -6.260310;
        env.device_ts_ms = 123456;
        return env;
    }

    std::string encoded(const TelemetryEnvelope& env) {
        char buf[Config::Telemetry::payload_max_len];
        std::size_t n = EnvelopeCodec::encode(env, buf, sizeof(buf));
        return std::string(buf, n);
    }

    EnvelopeCodec::DecodeError ingress(const std::string& body, TelemetryReport& out) {
        return EnvelopeCodec::decodeIngress(body.c_str(), static_cast<int>(body.size()), out);
    }
}

TEST(EnvelopeCodecTest, EncodesAllFields) {
    std::string json = encoded(baseEnvelope());
    EXPECT_NE(json.find("\"device_id\":\"wearer-07\""), std::string::npos);
    EXPECT_NE(json.find("\"status\":\"NORMAL\""), std::string::npos);
    EXPECT_NE(json.find("\"temperature\":31.50"), std::string::npos);
    EXPECT_NE(json.find("\"total_acc\":1.02"), std::string::npos);
    EXPECT_NE(json.find("\"movement\":\"MOVING\""), std::string::npos);
    EXPECT_NE(json.find("\"gps_status\":\"OK\""), std::string::npos);
    EXPECT_NE(json.find("\"system_status\":\"OK\""), std::string::npos);
    EXPECT_NE(json.find("\"timestamp\":123456"), std::string::npos);
}

TEST(EnvelopeCodecTest, InvalidTemperatureIsNull) {
    TelemetryEnvelope env = baseEnvelope();
    env.temperature_valid = false;
    env.temperature_c = 85.0f;
    env.health.environment_ok = false;
    std::string json = encoded(env);
    EXPECT_NE(json.find("\"temperature\":null"), std::string::npos);
    EXPECT_NE(json.find("\"dht_status\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"system_status\":\"SENSOR_FAILURE\""), std::string::npos);
}

TEST(EnvelopeCodecTest, StatusCarriesCauseSuffix) {
    TelemetryEnvelope env = baseEnvelope();
    env.state = DeviceState::EMERGENCY;
    env.causes = CAUSE_TEMP_CRITICAL | CAUSE_STILL_EMERGENCY;
    env.moving = false;
    env.still_ms = 20400;
    std::string json = encoded(env);
    EXPECT_NE(json.find("\"status\":\"EMERGENCY (HIGH TEMP + NO MOVEMENT)\""), std::string::npos);
    EXPECT_NE(json.find("\"movement\":\"STILL 20s\""), std::string::npos);
}

TEST(EnvelopeCodecTest, MissingFixReportsNoSignal) {
    TelemetryEnvelope env = baseEnvelope();
    env.health.position_ok = false;
    env.latitude = 0.0;
    env.longitude = 0.0;
    std::string json = encoded(env);
    EXPECT_NE(json.find("\"gps_status\":\"NO_SIGNAL\""), std::string::npos);
    // Position alone does not make the sensors unhealthy
    EXPECT_NE(json.find("\"system_status\":\"OK\""), std::string::npos);
}

TEST(EnvelopeCodecTest, RefusesUnsafeOrOversizedOutput) {
    TelemetryEnvelope env = baseEnvelope();
    std::snprintf(env.device_id, sizeof(env.device_id), "%s", "bad\"id");
    char buf[Config::Telemetry::payload_max_len];
    EXPECT_EQ(EnvelopeCodec::encode(env, buf, sizeof(buf)), 0u);

    env = baseEnvelope();
    char tiny[32];
    EXPECT_EQ(EnvelopeCodec::encode(env, tiny, sizeof(tiny)), 0u);
    EXPECT_STREQ(tiny, "");
}

TEST(EnvelopeCodecTest, EnvelopeDecodesBackIntoReport) {
    TelemetryEnvelope env = baseEnvelope();
    env.state = DeviceState::WARNING;
    env.causes = CAUSE_TEMP_HIGH;
    std::string json = encoded(env);

    TelemetryReport r;
    ASSERT_EQ(EnvelopeCodec::decodeEnvelope(json.c_str(), static_cast<int>(json.size()), r),
              EnvelopeCodec::DecodeError::NONE);
    EXPECT_STREQ(r.device_id, "wearer-07");
    EXPECT_TRUE(r.has_state);
    EXPECT_EQ(r.state, DeviceState::WARNING);
    EXPECT_EQ(r.causes, CAUSE_TEMP_HIGH);
    EXPECT_TRUE(r.temperature_valid);
    EXPECT_NEAR(r.temperature_c, 31.5f, 0.01f);
    EXPECT_TRUE(r.has_motion);
    EXPECT_TRUE(r.moving);
    EXPECT_TRUE(r.has_position);
    EXPECT_NEAR(r.latitude, 53.349805, 1e-6);
    EXPECT_TRUE(r.has_health);
    EXPECT_TRUE(r.sensors_ok);
    EXPECT_TRUE(r.has_device_ts);
    EXPECT_EQ(r.device_ts_ms, 123456u);
}

TEST(EnvelopeCodecTest, EnvelopeDropsPlaceholderPosition) {
    std::string json =
        "{\"device_id\":\"w\",\"status\":\"NORMAL\",\"gps_status\":\"NO_SIGNAL\","
        "\"latitude\":0.0,\"longitude\":0.0,\"system_status\":\"SENSOR_FAILURE\"}";
    TelemetryReport r;
    ASSERT_EQ(EnvelopeCodec::decodeEnvelope(json.c_str(), static_cast<int>(json.size()), r),
              EnvelopeCodec::DecodeError::NONE);
    EXPECT_FALSE(r.has_position);
    EXPECT_TRUE(r.has_health);
    EXPECT_FALSE(r.sensors_ok);
    EXPECT_FALSE(r.has_device_ts);
}

TEST(EnvelopeCodecTest, EpochTimestampIsNotADeviceTimestamp) {
    std::string json = "{\"device_id\":\"a\",\"status\":\"NORMAL\",\"timestamp\":1.7e12}";
    TelemetryReport r;
    ASSERT_EQ(EnvelopeCodec::decodeEnvelope(json.c_str(), static_cast<int>(json.size()), r),
              EnvelopeCodec::DecodeError::NONE);
    EXPECT_FALSE(r.has_device_ts);

    json = "{\"device_id\":\"a\",\"status\":\"NORMAL\",\"timestamp\":4294967295}";
    ASSERT_EQ(EnvelopeCodec::decodeEnvelope(json.c_str(), static_cast<int>(json.size()), r),
              EnvelopeCodec::DecodeError::NONE);
    EXPECT_TRUE(r.has_device_ts);
    EXPECT_EQ(r.device_ts_ms, 4294967295u);
}

TEST(EnvelopeCodecTest, TemperatureOutsideFloatRangeIsInvalid) {
    TelemetryReport r;
    ASSERT_EQ(ingress("{\"device_id\":\"a\",\"temperature\":1e300}", r), EnvelopeCodec::DecodeError::NONE);
    EXPECT_FALSE(r.temperature_valid);
    ASSERT_EQ(ingress("{\"device_id\":\"a\",\"temperature\":-1e300}", r), EnvelopeCodec::DecodeError::NONE);
    EXPECT_FALSE(r.temperature_valid);
    ASSERT_EQ(ingress("{\"device_id\":\"a\",\"temperature\":-12.5}", r), EnvelopeCodec::DecodeError::NONE);
    EXPECT_TRUE(r.temperature_valid);
    EXPECT_FLOAT_EQ(r.temperature_c, -12.5f);
}

TEST(EnvelopeCodecTest, EnvelopeRequiresStatus) {
    std::string json = "{\"device_id\":\"w\",\"temperature\":30}";
    TelemetryReport r;
    EXPECT_EQ(EnvelopeCodec::decodeEnvelope(json.c_str(), static_cast<int>(json.size()), r),
              EnvelopeCodec::DecodeError::INVALID_STATUS);
}

TEST(EnvelopeCodecTest, IngressAcceptsHeartbeat) {
    TelemetryReport r;
    ASSERT_EQ(ingress("{\"device_id\":\"w2\"}", r), EnvelopeCodec::DecodeError::NONE);
    EXPECT_STREQ(r.device_id, "w2");
    EXPECT_FALSE(r.has_state);
    EXPECT_FALSE(r.temperature_valid);
    EXPECT_FALSE(r.has_motion);
    EXPECT_FALSE(r.has_position);
}

TEST(EnvelopeCodecTest, IngressReadsOptionalFields) {
    TelemetryReport r;
    ASSERT_EQ(ingress("{\"device_id\":\"w2\",\"status\":\"SOS\",\"temperature\":null,"
                      "\"movement\":\"STILL 12s\",\"latitude\":1.5,\"longitude\":2.5}", r),
              EnvelopeCodec::DecodeError::NONE);
    EXPECT_EQ(r.state, DeviceState::SOS);
    EXPECT_EQ(r.causes, CAUSE_SOS);
    EXPECT_FALSE(r.temperature_valid);
    EXPECT_TRUE(r.has_motion);
    EXPECT_FALSE(r.moving);
    EXPECT_EQ(r.still_s, 12u);
    EXPECT_TRUE(r.has_position);
}

TEST(EnvelopeCodecTest, IngressErrors) {
    TelemetryReport r;
    EXPECT_EQ(ingress("not json", r), EnvelopeCodec::DecodeError::INVALID_JSON);
    EXPECT_EQ(ingress("[1,2]", r), EnvelopeCodec::DecodeError::INVALID_JSON);
    EXPECT_EQ(ingress("{\"device_id\":", r), EnvelopeCodec::DecodeError::INVALID_JSON);
    EXPECT_EQ(ingress("{\"status\":\"NORMAL\"}", r), EnvelopeCodec::DecodeError::MISSING_DEVICE_ID);
    EXPECT_EQ(ingress("{\"device_id\":\"\"}", r), EnvelopeCodec::DecodeError::MISSING_DEVICE_ID);
    EXPECT_EQ(ingress("{\"device_id\":\"w\",\"status\":\"PANIC\"}", r),
              EnvelopeCodec::DecodeError::INVALID_STATUS);
    EXPECT_EQ(ingress("{\"device_id\":\"w\",\"status\":\"OFFLINE\"}", r),
              EnvelopeCodec::DecodeError::INVALID_STATUS);
    EXPECT_EQ(ingress("{\"device_id\":\"w\",\"status\":3}", r),
              EnvelopeCodec::DecodeError::INVALID_STATUS);
}

TEST(EnvelopeCodecTest, MovementText) {
    char buf[24];
    EnvelopeCodec::formatMovement(false, 15999, buf, sizeof(buf));
    EXPECT_STREQ(buf, "STILL 15s");
    bool moving = true;
    uint32_t still_s = 0;
    EXPECT_TRUE(EnvelopeCodec::parseMovement(buf, moving, still_s));
    EXPECT_FALSE(moving);
    EXPECT_EQ(still_s, 15u);
    EXPECT_FALSE(EnvelopeCodec::parseMovement("RUNNING", moving, still_s));
}
