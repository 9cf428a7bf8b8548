#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <main/console/ingress_handler.hpp>
#include <cstring>
#include <string>

using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;

namespace {
    class MockSink : public IngressSink {
    public:
        MOCK_METHOD(SubmitResult, submit, (const TelemetryReport& report), (override));
    };

    IngressResponse post(const std::string& body, IngressSink* sink) {
        return IngressHandler::handle(body.c_str(), static_cast<int>(body.size()), sink);
    }
}

TEST(IngressHandlerTest, AcceptedReportReturnsOk) {
    MockSink sink;
    TelemetryReport seen{};
    EXPECT_CALL(sink, submit(_))
        .WillOnce(testing::DoAll(SaveArg<0>(&seen), Return(IngressSink::SubmitResult::ACCEPTED)));

    IngressResponse res = post("{\"device_id\":\"w9\",\"status\":\"WARNING (HIGH TEMP)\"}", &sink);
    EXPECT_EQ(res.status, 200);
    EXPECT_STREQ(res.body, "{\"success\":true}");
    EXPECT_STREQ(seen.device_id, "w9");
    EXPECT_EQ(seen.state, DeviceState::WARNING);
    EXPECT_EQ(seen.causes, CAUSE_TEMP_HIGH);
}

TEST(IngressHandlerTest, MalformedBodiesAreClientErrors) {
    MockSink sink;
    EXPECT_CALL(sink, submit(_)).Times(0);

    IngressResponse res = post("{oops", &sink);
    EXPECT_EQ(res.status, 400);
    EXPECT_NE(std::strstr(res.body, "invalid JSON"), nullptr);

    res = post("{\"temperature\":30}", &sink);
    EXPECT_EQ(res.status, 400);
    EXPECT_NE(std::strstr(res.body, "device_id"), nullptr);

    res = post("{\"device_id\":\"w\",\"status\":\"BORED\"}", &sink);
    EXPECT_EQ(res.status, 400);
    EXPECT_NE(std::strstr(res.body, "status"), nullptr);

    res = post("", &sink);
    EXPECT_EQ(res.status, 400);
}

TEST(IngressHandlerTest, MissingPipelineIsUnavailable) {
    IngressResponse res = post("{\"device_id\":\"w\"}", nullptr);
    EXPECT_EQ(res.status, 503);
}

TEST(IngressHandlerTest, SinkFailuresMapToServerErrors) {
    MockSink sink;
    EXPECT_CALL(sink, submit(_))
        .WillOnce(Return(IngressSink::SubmitResult::UNAVAILABLE))
        .WillOnce(Return(IngressSink::SubmitResult::FAILED));

    EXPECT_EQ(post("{\"device_id\":\"w\"}", &sink).status, 503);
    EXPECT_EQ(post("{\"device_id\":\"w\"}", &sink).status, 500);
}

TEST(IngressHandlerTest, TransportLevelResponses) {
    EXPECT_EQ(IngressHandler::payloadTooLarge().status, 400);
    EXPECT_EQ(IngressHandler::readFailed().status, 500);
}
