/// @file test_util.cpp
/// Unit tests for util.hpp — URL parsing, RFC-2822 dates and cursor seeding.

#include "util.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>

using namespace camper;
using std::chrono::seconds;
using std::chrono::system_clock;

static int64_t epochSeconds(system_clock::time_point tp) {
    return std::chrono::duration_cast<seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:4000/api");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "4000");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://bandcamp.com");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "bandcamp.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/prefix");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/prefix");
}

TEST(ParseUrl, TrailingSlashIsDropped) {
    EXPECT_EQ(parseUrl("https://bandcamp.com/").target, "");
    EXPECT_EQ(parseUrl("http://127.0.0.1:8080/proxy/").target, "/proxy");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("bandcamp.com/api"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://bandcamp.com"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///api"), std::invalid_argument);
}

TEST(ParseUrl, EmptyPortThrows) {
    EXPECT_THROW(parseUrl("http://localhost:/api"), std::invalid_argument);
}

// ============================================================================
// parseTimeoutMs
// ============================================================================

TEST(ParseTimeoutMs, AcceptsPositiveInt) {
    EXPECT_EQ(parseTimeoutMs("1"), 1);
    EXPECT_EQ(parseTimeoutMs("10000"), 10000);
    EXPECT_EQ(parseTimeoutMs("2147483647"), 2147483647);
}

TEST(ParseTimeoutMs, RejectsZeroAndOverflow) {
    EXPECT_THROW(parseTimeoutMs("0"), std::invalid_argument);
    EXPECT_THROW(parseTimeoutMs("2147483648"), std::invalid_argument);
    EXPECT_THROW(parseTimeoutMs("4294967295"), std::invalid_argument);
    EXPECT_THROW(parseTimeoutMs("99999999999999"), std::invalid_argument);
}

TEST(ParseTimeoutMs, RejectsNonNumeric) {
    EXPECT_THROW(parseTimeoutMs(""), std::invalid_argument);
    EXPECT_THROW(parseTimeoutMs("-5"), std::invalid_argument);
    EXPECT_THROW(parseTimeoutMs("5s"), std::invalid_argument);
}

// ============================================================================
// parseRfc2822DateTime
// ============================================================================

TEST(ParseRfc2822, NumericOffsetIsNormalisedToUtc) {
    auto tp = parseRfc2822DateTime("Mon, 02 Jan 2006 15:04:05 -0700");
    EXPECT_EQ(epochSeconds(tp), 1136239445);
    EXPECT_EQ(formatUtc(tp), "2006-01-02 22:04:05");
}

TEST(ParseRfc2822, BandcampStyleWithoutWeekday) {
    auto tp = parseRfc2822DateTime("16 Mar 2022 18:38:32 GMT");
    EXPECT_EQ(formatUtc(tp), "2022-03-16 18:38:32");
}

TEST(ParseRfc2822, PositiveOffset) {
    auto tp = parseRfc2822DateTime("Tue, 03 Jan 2006 01:00:00 +0130");
    EXPECT_EQ(formatUtc(tp), "2006-01-02 23:30:00");
}

TEST(ParseRfc2822, OffsetCrossesYearBoundary) {
    auto tp = parseRfc2822DateTime("Sat, 31 Dec 2022 23:30:00 -0100");
    EXPECT_EQ(formatUtc(tp), "2023-01-01 00:30:00");
}

TEST(ParseRfc2822, SecondsAreOptional) {
    auto tp = parseRfc2822DateTime("2 Jan 2006 15:04 +0000");
    EXPECT_EQ(formatUtc(tp), "2006-01-02 15:04:00");
}

TEST(ParseRfc2822, TwoDigitYear) {
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("02 Jan 06 15:04:05 UT")),
              "2006-01-02 15:04:05");
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("02 Jan 99 15:04:05 UT")),
              "1999-01-02 15:04:05");
}

TEST(ParseRfc2822, NamedUsZones) {
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("02 Jan 2006 10:00:00 EST")),
              "2006-01-02 15:00:00");
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("02 Jul 2006 10:00:00 PDT")),
              "2006-07-02 17:00:00");
}

TEST(ParseRfc2822, CaseInsensitiveNames) {
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("mon, 02 JAN 2006 15:04:05 gmt")),
              "2006-01-02 15:04:05");
}

TEST(ParseRfc2822, LeapDay) {
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("29 Feb 2024 12:00:00 +0000")),
              "2024-02-29 12:00:00");
}

TEST(ParseRfc2822, GarbageThrows) {
    EXPECT_THROW(parseRfc2822DateTime("not-a-date"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime(""), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("2006-01-02T15:04:05Z"), std::invalid_argument);
}

TEST(ParseRfc2822, WrongWeekdayThrows) {
    EXPECT_THROW(parseRfc2822DateTime("Tue, 02 Jan 2006 15:04:05 -0700"),
                 std::invalid_argument);
}

TEST(ParseRfc2822, OutOfRangeFieldsThrow) {
    EXPECT_THROW(parseRfc2822DateTime("29 Feb 2023 12:00:00 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("32 Jan 2023 12:00:00 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 24:00:00 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:60:00 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:04:05 +0060"), std::invalid_argument);
}

TEST(ParseRfc2822, OutOfRangeYearThrows) {
    EXPECT_THROW(parseRfc2822DateTime("01 Jan 1000 00:00:00 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("31 Dec 1899 23:59:59 +0000"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("01 Jan 999999999 00:00:00 +0000"), std::invalid_argument);
}

TEST(ParseRfc2822, YearRangeBoundaries) {
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("01 Jan 1900 00:00:00 +0000")),
              "1900-01-01 00:00:00");
    EXPECT_EQ(formatUtc(parseRfc2822DateTime("31 Dec 2199 23:59:59 +0000")),
              "2199-12-31 23:59:59");
}

TEST(ParseRfc2822, MissingOrUnknownZoneThrows) {
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:04:05"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:04:05 XYZ"), std::invalid_argument);
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:04:05 +07"), std::invalid_argument);
}

TEST(ParseRfc2822, TrailingGarbageThrows) {
    EXPECT_THROW(parseRfc2822DateTime("02 Jan 2006 15:04:05 +0000 extra"),
                 std::invalid_argument);
}

// ============================================================================
// formatUtc / makeContinuationToken
// ============================================================================

TEST(FormatUtc, Epoch) {
    EXPECT_EQ(formatUtc(system_clock::time_point{}), "1970-01-01 00:00:00");
}

TEST(FormatUtc, BeforeEpoch) {
    EXPECT_EQ(formatUtc(system_clock::time_point(seconds(-1))),
              "1969-12-31 23:59:59");
}

TEST(MakeContinuationToken, UsesUnixSeconds) {
    system_clock::time_point now(seconds(1700000000));
    EXPECT_EQ(makeContinuationToken(now), "1700000000:0:a::");
}

TEST(MakeContinuationToken, DropsSubSecondPart) {
    system_clock::time_point now(seconds(1700000000) + std::chrono::milliseconds(999));
    EXPECT_EQ(makeContinuationToken(now), "1700000000:0:a::");
}
