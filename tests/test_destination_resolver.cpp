/**
 * @file test_destination_resolver.cpp
 * @brief Unit tests for remote path construction and timestamp formatting
 */

#include <gtest/gtest.h>
#include "destination_resolver.hpp"
#include <chrono>
#include <string>
#include <utility>

using namespace std::chrono;

namespace {

// 2024-01-02 15:30:45 UTC
system_clock::time_point fixedClock() {
    return sys_days{year{2024} / 1 / 2} + hours{15} + minutes{30} + seconds{45};
}

} // namespace

// ============================================================================
// Base directory and name handling
// ============================================================================

TEST(DestinationResolverTest, AppendsSeparatorToBaseDir) {
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir", "report.csv", false, "", fixedClock()).value(),
              "/remote/dir/report.csv");
}

TEST(DestinationResolverTest, KeepsSingleTrailingSeparator) {
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir/", "report.csv", false, "", fixedClock()).value(),
              "/remote/dir/report.csv");
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir//", "report.csv", false, "", fixedClock()).value(),
              "/remote/dir/report.csv");
    EXPECT_EQ(DestinationResolver::resolve("/", "report.csv", false, "", fixedClock()).value(), "/report.csv");
}

TEST(DestinationResolverTest, UsesBaseNameOfLogicalName) {
    EXPECT_EQ(DestinationResolver::resolve("/remote", "nested/dir/report.csv", false, "", fixedClock()).value(),
              "/remote/report.csv");
}

// ============================================================================
// Date stamping
// ============================================================================

TEST(DestinationResolverTest, StampsBetweenStemAndExtension) {
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir/", "report.csv", true, "YYYYMMDD", fixedClock()).value(),
              "/remote/dir/report_20240102.csv");
}

TEST(DestinationResolverTest, StampsNameWithoutExtension) {
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir", "data", true, "YYYYMMDD", fixedClock()).value(),
              "/remote/dir/data_20240102");
    EXPECT_EQ(DestinationResolver::resolve("/remote/dir", "data", false, "YYYYMMDD", fixedClock()).value(),
              "/remote/dir/data");
}

TEST(DestinationResolverTest, OnlyLastExtensionIsSplit) {
    EXPECT_EQ(DestinationResolver::resolve("/r", "archive.tar.gz", true, "YYYYMMDD", fixedClock()).value(),
              "/r/archive.tar_20240102.gz");
}

TEST(DestinationResolverTest, LeadingDotIsNotAnExtension) {
    EXPECT_EQ(DestinationResolver::resolve("/r", ".env", true, "YYYYMMDD", fixedClock()).value(), "/r/.env_20240102");
}

TEST(DestinationResolverTest, OnlyDotsBeforeLastDotMeanNoExtension) {
    EXPECT_EQ(DestinationResolver::resolve("/r", "..bashrc", true, "YYYYMMDD", fixedClock()).value(),
              "/r/..bashrc_20240102");
    EXPECT_EQ(DestinationResolver::resolve("/r", "...", true, "YYYYMMDD", fixedClock()).value(), "/r/..._20240102");
    EXPECT_EQ(DestinationResolver::resolve("/r", "..a.b", true, "YYYYMMDD", fixedClock()).value(),
              "/r/..a_20240102.b");
}

TEST(DestinationResolverTest, SplitsExtensions) {
    EXPECT_EQ(splitExtension("report.csv"), (std::pair<std::string, std::string>{"report", ".csv"}));
    EXPECT_EQ(splitExtension("a."), (std::pair<std::string, std::string>{"a", "."}));
    EXPECT_EQ(splitExtension(".env"), (std::pair<std::string, std::string>{".env", ""}));
    EXPECT_EQ(splitExtension("..bashrc"), (std::pair<std::string, std::string>{"..bashrc", ""}));
    EXPECT_EQ(splitExtension(""), (std::pair<std::string, std::string>{"", ""}));
}

TEST(DestinationResolverTest, DefaultFormatIncludesTime) {
    EXPECT_EQ(DestinationResolver::resolve("/r", "report.csv", true, "", fixedClock()).value(),
              "/r/report_20240102153045.csv");
    EXPECT_EQ(DestinationResolver::resolve("/r", "report.csv", true, kDefaultDateFormat, fixedClock()).value(),
              "/r/report_20240102153045.csv");
}

// ============================================================================
// Timestamp formats
// ============================================================================

TEST(DestinationResolverTest, TokenFormats) {
    EXPECT_EQ(formatTimestamp("YYYY-MM-DD", fixedClock()).value(), "2024-01-02");
    EXPECT_EQ(formatTimestamp("YYMMDD_HHmmss", fixedClock()).value(), "240102_153045");
    EXPECT_EQ(formatTimestamp("HH:MM:SS", fixedClock()).value(), "15:30:45");
}

TEST(DestinationResolverTest, StrftimeFormats) {
    EXPECT_EQ(formatTimestamp("%Y%m%d%H%M%S", fixedClock()).value(), "20240102153045");
    EXPECT_EQ(formatTimestamp("%Y-%m-%dT%H", fixedClock()).value(), "2024-01-02T15");
}

TEST(DestinationResolverTest, LongStrftimeOutputIsNotTruncated) {
    std::string pattern;
    std::string expected;
    for (int i = 0; i < 100; ++i) {
        pattern += "%Y-%m-%d ";
        expected += "2024-01-02 ";
    }
    auto stamp = formatTimestamp(pattern, fixedClock());
    ASSERT_TRUE(stamp.has_value());
    EXPECT_EQ(*stamp, expected);
}

TEST(DestinationResolverTest, UnrenderableStrftimeFormatIsConfigurationError) {
    std::string pattern;
    for (int i = 0; i < 2100; ++i) {
        pattern += "%Y";
    }
    auto stamp = formatTimestamp(pattern, fixedClock());
    ASSERT_FALSE(stamp.has_value());
    EXPECT_EQ(stamp.error().kind, ErrorKind::InvalidConfiguration);

    auto path = DestinationResolver::resolve("/r", "report.csv", true, pattern, fixedClock());
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().kind, ErrorKind::InvalidConfiguration);
}
