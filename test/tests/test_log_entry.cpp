#include <gtest/gtest.h>
#include "gcp_log.hpp"
#include "utils/test_utils.hpp"
#include <string>

class LogEntryTest : public ::testing::Test {};

TEST_F(LogEntryTest, DefaultEntryHasNoFields) {
    gcplog::StructuredLogEntry entry;
    EXPECT_FALSE(entry.hasSeverity());
    EXPECT_FALSE(entry.hasMessage());
    EXPECT_FALSE(entry.hasReportType());
    EXPECT_FALSE(entry.hasHttpRequest());
    EXPECT_FALSE(entry.hasTime());
    EXPECT_FALSE(entry.hasInsertId());
    EXPECT_TRUE(entry.labels().empty());
    EXPECT_FALSE(entry.hasOperation());
    EXPECT_FALSE(entry.hasSourceLocation());
    EXPECT_FALSE(entry.hasSpanId());
    EXPECT_FALSE(entry.hasTrace());
    EXPECT_FALSE(entry.hasTraceSampled());
}

TEST_F(LogEntryTest, ChainedOverrides) {
    gcplog::StructuredLogEntry entry;
    entry.setSeverity(gcplog::LogSeverity::Warning)
         .setMessage("careful")
         .setTraceSampled(false);

    EXPECT_TRUE(entry.hasSeverity());
    EXPECT_EQ(entry.severity(), gcplog::LogSeverity::Warning);
    EXPECT_EQ(entry.message(), "careful");
    // false is a value, not absence
    EXPECT_TRUE(entry.hasTraceSampled());
    EXPECT_FALSE(entry.traceSampled());
}

TEST_F(LogEntryTest, EmptyStringIsStillPresent) {
    gcplog::StructuredLogEntry entry;
    entry.setMessage("");
    EXPECT_TRUE(entry.hasMessage());
    EXPECT_EQ(entry.message(), "");
}

TEST_F(LogEntryTest, ClearRestoresAbsence) {
    gcplog::StructuredLogEntry entry;
    entry.setMessage("hello").setInsertId("abc").addLabel("k", "v");
    entry.clearMessage();
    entry.clearInsertId();
    entry.clearLabels();
    EXPECT_FALSE(entry.hasMessage());
    EXPECT_FALSE(entry.hasInsertId());
    EXPECT_TRUE(entry.labels().empty());
    EXPECT_EQ(entry, gcplog::StructuredLogEntry());
}

TEST_F(LogEntryTest, ReportAsErrorUsesErrorReportingType) {
    gcplog::StructuredLogEntry entry;
    entry.reportAsError();
    EXPECT_EQ(entry.reportType(),
              "type.googleapis.com/google.devtools.clouderrorreporting.v1beta1.ReportedErrorEvent");
    // Severity is left to the caller.
    EXPECT_FALSE(entry.hasSeverity());
}

TEST_F(LogEntryTest, MutableNestedStructureMarksPresence) {
    gcplog::StructuredLogEntry entry;
    entry.mutableOperation().setId("My Service");
    EXPECT_TRUE(entry.hasOperation());
    EXPECT_EQ(entry.operation().id(), "My Service");
    EXPECT_FALSE(entry.operation().hasProducer());

    entry.mutableSourceLocation();
    EXPECT_TRUE(entry.hasSourceLocation());
    EXPECT_TRUE(entry.sourceLocation().empty());
}

TEST_F(LogEntryTest, LabelsReplaceByKey) {
    gcplog::StructuredLogEntry entry;
    entry.addLabel("env", "dev").addLabel("env", "prod").addLabel("zone", "a");
    ASSERT_EQ(entry.labels().size(), 2u);
    EXPECT_EQ(entry.labels().at("env"), "prod");
}

TEST_F(LogEntryTest, SourceLocationLineIsText) {
    gcplog::SourceLocation location;
    location.setLineNumber(11);
    EXPECT_EQ(location.line(), "11");
    location.setLine("42");
    EXPECT_EQ(location.line(), "42");
}

TEST_F(LogEntryTest, FromCallSiteSkipsUnknownParts) {
    gcplog::SourceLocation location = gcplog::SourceLocation::fromCallSite(nullptr, 0, "run");
    EXPECT_FALSE(location.hasFile());
    EXPECT_FALSE(location.hasLine());
    EXPECT_EQ(location.function(), "run");
}

TEST_F(LogEntryTest, ValueEquality) {
    gcplog::StructuredLogEntry a;
    a.setSeverity(gcplog::LogSeverity::Info)
     .setMessage("Start logging")
     .setTime(TestUtils::referenceTime())
     .setOperation(gcplog::Operation().setId("My Service").setProducer("MyService.Backend"));

    gcplog::StructuredLogEntry b = a;
    EXPECT_EQ(a, b);

    b.mutableOperation().setLast(true);
    EXPECT_NE(a, b);
}

TEST_F(LogEntryTest, OperationFlagsAreIndependent) {
    gcplog::Operation operation;
    operation.setFirst(true);
    EXPECT_TRUE(operation.hasFirst());
    EXPECT_FALSE(operation.hasLast());
    EXPECT_FALSE(operation.empty());
    operation.clearFirst();
    EXPECT_TRUE(operation.empty());
}

TEST_F(LogEntryTest, HttpRequestFields) {
    gcplog::HttpRequest request;
    EXPECT_TRUE(request.empty());
    request.setRequestMethod(gcplog::HttpMethod::Post).setStatus(404).setLatency("3.5s");
    EXPECT_EQ(request.requestMethod(), gcplog::HttpMethod::Post);
    EXPECT_EQ(request.status(), 404);
    EXPECT_EQ(request.latency(), "3.5s");
    EXPECT_FALSE(request.hasRequestUrl());
}
