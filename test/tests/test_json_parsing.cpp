#include <gtest/gtest.h>
#include "gcp_log.hpp"
#include "utils/test_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

class JsonParsingTest : public ::testing::Test {
protected:
    static gcplog::StructuredLogEntry fullEntry() {
        gcplog::StructuredLogEntry entry;
        entry.setSeverity(gcplog::LogSeverity::Error)
             .setMessage("Yeah, this is not good.")
             .reportAsError()
             .setTime(TestUtils::referenceTime())
             .setInsertId("insert-1")
             .addLabel("env", "prod")
             .addLabel("region", "europe-west1")
             .setOperation(gcplog::Operation().setId("My Service").setProducer("MyService.Backend")
                                              .setFirst(false).setLast(true))
             .setSourceLocation(gcplog::SourceLocation().setFile("main.cpp").setLineNumber(11)
                                                        .setFunction("app::run"))
             .setSpanId("000000000000004a")
             .setTrace("projects/p/traces/06796866738c859f2f19b7cfb3214824")
             .setTraceSampled(true);
        entry.mutableHttpRequest()
             .setRequestMethod(gcplog::HttpMethod::Put)
             .setRequestUrl("https://example.com/items/7")
             .setRequestSize("512")
             .setStatus(503)
             .setResponseSize("0")
             .setUserAgent("curl/8.0")
             .setRemoteIp("10.0.0.1:80")
             .setServerIp("FE80::0202:B3FF:FE1E:8329")
             .setLatency("0.25s")
             .setProtocol("HTTP/2");
        return entry;
    }
};

TEST_F(JsonParsingTest, RoundTripPreservesEveryField) {
    gcplog::StructuredLogEntry original = fullEntry();
    gcplog::StructuredLogEntry parsed = gcplog::parseJsonLine(gcplog::toJsonLine(original));
    EXPECT_EQ(parsed, original);
    EXPECT_EQ(gcplog::toJsonLine(parsed), gcplog::toJsonLine(original));
}

TEST_F(JsonParsingTest, GenericReparseKeepsValues) {
    nlohmann::json j = nlohmann::json::parse(gcplog::toJsonLine(fullEntry()));
    EXPECT_EQ(j["severity"], "error");
    EXPECT_EQ(j["message"], "Yeah, this is not good.");
    EXPECT_EQ(j["@type"], gcplog::kErrorReportingType);
    EXPECT_EQ(j["time"], "2021-12-20T16:33:41.643966093Z");
    EXPECT_EQ(j["logging.googleapis.com/insertId"], "insert-1");
    EXPECT_EQ(j["logging.googleapis.com/operation"]["last"], true);
    EXPECT_EQ(j["logging.googleapis.com/sourceLocation"]["line"], "11");
    EXPECT_EQ(j["httpRequest"]["status"], 503);
    EXPECT_EQ(j["httpRequest"]["requestMethod"], "put");
}

TEST_F(JsonParsingTest, EmptyObjectParsesToEmptyEntry) {
    EXPECT_EQ(gcplog::parseJsonLine("{}"), gcplog::StructuredLogEntry());
}

TEST_F(JsonParsingTest, NullMeansAbsent) {
    gcplog::StructuredLogEntry entry = gcplog::parseJsonLine(R"({"message":null,"severity":"info"})");
    EXPECT_FALSE(entry.hasMessage());
    EXPECT_EQ(entry.severity(), gcplog::LogSeverity::Info);
}

TEST_F(JsonParsingTest, UnknownKeysAreIgnored) {
    gcplog::StructuredLogEntry entry =
        gcplog::parseJsonLine(R"({"message":"hi","component":"arbitrary","count":3})");
    gcplog::StructuredLogEntry expected;
    expected.setMessage("hi");
    EXPECT_EQ(entry, expected);
}

TEST_F(JsonParsingTest, AcceptsOffsetTimestamps) {
    gcplog::StructuredLogEntry entry =
        gcplog::parseJsonLine(R"({"time":"2021-12-20T17:33:41.643966093+01:00"})");
    EXPECT_EQ(entry.time(), TestUtils::referenceTime());
}

TEST_F(JsonParsingTest, RejectsMalformedInput) {
    EXPECT_THROW(gcplog::parseJsonLine("not json"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine("[]"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"severity":"fatal"})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"severity":3})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"time":"yesterday"})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"logging.googleapis.com/sourceLocation":{"line":11}})"),
                 std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"logging.googleapis.com/operation":"op"})"),
                 std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"time":"2021-02-31T00:00:00Z"})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"httpRequest":{"status":70000}})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"httpRequest":{"status":-1}})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"httpRequest":{"status":200.5}})"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseJsonLine(R"({"httpRequest":{"status":"200"}})"), std::invalid_argument);
}

TEST_F(JsonParsingTest, StatusAcceptsFullSixteenBitRange) {
    EXPECT_EQ(gcplog::parseJsonLine(R"({"httpRequest":{"status":0}})").httpRequest().status(), 0u);
    EXPECT_EQ(gcplog::parseJsonLine(R"({"httpRequest":{"status":65535}})").httpRequest().status(), 65535u);
}

TEST_F(JsonParsingTest, GetConvertsThroughAdl) {
    nlohmann::json j = {{"severity", "notice"}, {"message", "adl"}};
    gcplog::StructuredLogEntry entry = j.get<gcplog::StructuredLogEntry>();
    EXPECT_EQ(entry.severity(), gcplog::LogSeverity::Notice);
    EXPECT_EQ(entry.message(), "adl");
}
