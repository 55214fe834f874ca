#include <gtest/gtest.h>
#include "gcp_log.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <regex>
#include <stdexcept>
#include <string>
#include <type_traits>

class TimestampTest : public ::testing::Test {};

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

TEST_F(TimestampTest, FormatsNanosecondsInUtc) {
    EXPECT_EQ(gcplog::formatTimestamp(TestUtils::referenceTime()),
              "2021-12-20T16:33:41.643966093Z");
}

TEST_F(TimestampTest, WholeSecondsKeepFraction) {
    EXPECT_EQ(gcplog::formatTimestamp(TestUtils::fromEpoch(1709208000LL)),
              "2024-02-29T12:00:00.000000000Z");
}

TEST_F(TimestampTest, EpochFormats) {
    EXPECT_EQ(gcplog::formatTimestamp(gcplog::Timestamp()), "1970-01-01T00:00:00.000000000Z");
}

TEST_F(TimestampTest, PreEpochFloorsToPreviousSecond) {
    // 250ms before the epoch
    gcplog::Timestamp t = TestUtils::fromEpoch(0, -250000000LL);
    EXPECT_EQ(gcplog::formatTimestamp(t), "1969-12-31T23:59:59.750000000Z");
}

TEST_F(TimestampTest, NowMatchesFixedLayout) {
    std::string text = gcplog::formatTimestamp(std::chrono::system_clock::now());
    std::regex layout(R"(^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{9}Z$)");
    EXPECT_TRUE(std::regex_match(text, layout)) << text;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST_F(TimestampTest, ParsesOwnOutput) {
    gcplog::Timestamp t = TestUtils::referenceTime();
    EXPECT_EQ(gcplog::parseTimestamp(gcplog::formatTimestamp(t)), t);
}

TEST_F(TimestampTest, ParsesVaryingFractionDigits) {
    EXPECT_EQ(gcplog::parseTimestamp("2021-12-20T16:33:41Z"),
              TestUtils::fromEpoch(1640018021LL));
    EXPECT_EQ(gcplog::parseTimestamp("2021-12-20T16:33:41.5Z"),
              TestUtils::fromEpoch(1640018021LL, 500000000LL));
    EXPECT_EQ(gcplog::parseTimestamp("2021-12-20T16:33:41.643966Z"),
              TestUtils::fromEpoch(1640018021LL, 643966000LL));
}

TEST_F(TimestampTest, NormalizesOffsetsToUtc) {
    EXPECT_EQ(gcplog::parseTimestamp("2021-12-20T18:33:41.643966093+02:00"),
              TestUtils::referenceTime());
    EXPECT_EQ(gcplog::parseTimestamp("2021-12-20T11:03:41.643966093-05:30"),
              TestUtils::referenceTime());
}

TEST_F(TimestampTest, ParsesPreEpoch) {
    EXPECT_EQ(gcplog::parseTimestamp("1969-12-31T23:59:59.750Z"),
              TestUtils::fromEpoch(0, -250000000LL));
}

TEST_F(TimestampTest, RejectsMalformedInput) {
    EXPECT_THROW(gcplog::parseTimestamp(""), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-12-20 16:33:41Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-12-20T16:33:41"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-13-20T16:33:41Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-12-20T16:33:41.Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-12-20T16:33:41.1234567891Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-12-20T16:33:41Zjunk"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-02-31T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2021-04-31T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("2100-02-29T00:00:00Z"), std::invalid_argument);
}

TEST_F(TimestampTest, RejectsDatesOutsideClockRange) {
    // A nanosecond system_clock spans roughly 1677 to 2262.
    if (!std::is_same<gcplog::Timestamp::duration, std::chrono::nanoseconds>::value) {
        GTEST_SKIP() << "system_clock is not nanosecond based";
    }
    EXPECT_THROW(gcplog::parseTimestamp("9999-12-31T23:59:59Z"), std::invalid_argument);
    EXPECT_THROW(gcplog::parseTimestamp("0001-01-01T00:00:00Z"), std::invalid_argument);
    EXPECT_EQ(gcplog::formatTimestamp(gcplog::parseTimestamp("2262-01-01T00:00:00Z")),
              "2262-01-01T00:00:00.000000000Z");
}

TEST_F(TimestampTest, AcceptsLeapDays) {
    EXPECT_EQ(gcplog::parseTimestamp("2024-02-29T12:00:00Z"), TestUtils::fromEpoch(1709208000LL));
    EXPECT_EQ(gcplog::formatTimestamp(gcplog::parseTimestamp("2000-02-29T00:00:00Z")),
              "2000-02-29T00:00:00.000000000Z");
}

TEST_F(TimestampTest, AcceptsLastDayOfEachMonth) {
    EXPECT_EQ(gcplog::formatTimestamp(gcplog::parseTimestamp("2021-04-30T00:00:00Z")),
              "2021-04-30T00:00:00.000000000Z");
    EXPECT_EQ(gcplog::formatTimestamp(gcplog::parseTimestamp("2021-12-31T23:59:59Z")),
              "2021-12-31T23:59:59.000000000Z");
}
