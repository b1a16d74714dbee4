#include <gtest/gtest.h>
#include "restrictions.hpp"
#include "natscred/errors.hpp"
#include <cstdint>
#include <limits>
#include <string>

using namespace natscred;
using namespace natscred::internal;

// ============================================================================
// CIDR blocks
// ============================================================================

TEST(CidrTest, AcceptsCanonicalBlocks) {
    EXPECT_NO_THROW(checkCidr("src", "10.0.0.0/8"));
    EXPECT_NO_THROW(checkCidr("src", "192.168.1.0/24"));
    EXPECT_NO_THROW(checkCidr("src", "192.168.1.7/32"));
    EXPECT_NO_THROW(checkCidr("src", "0.0.0.0/0"));
    EXPECT_NO_THROW(checkCidr("src", "fd00::/8"));
    EXPECT_NO_THROW(checkCidr("src", "::1/128"));
}

TEST(CidrTest, RejectsMissingPrefix) {
    EXPECT_THROW(checkCidr("src", "10.0.0.0"), MalformedInput);
}

TEST(CidrTest, RejectsBadAddress) {
    EXPECT_THROW(checkCidr("src", "10.0.0/8"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "300.0.0.0/8"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "example.com/8"), MalformedInput);
}

TEST(CidrTest, RejectsBadPrefixLength) {
    EXPECT_THROW(checkCidr("src", "10.0.0.0/33"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "10.0.0.0/08"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "10.0.0.0/"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "fd00::/129"), MalformedInput);
}

TEST(CidrTest, RejectsHostBits) {
    EXPECT_THROW(checkCidr("src", "10.0.0.1/8"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "192.168.1.1/24"), MalformedInput);
}

TEST(CidrTest, RejectsNonCanonicalText) {
    EXPECT_THROW(checkCidr("src", "FD00::/8"), MalformedInput);
    EXPECT_THROW(checkCidr("src", "fd00:0:0:0:0:0:0:0/8"), MalformedInput);
}

TEST(CidrTest, ErrorNamesField) {
    try {
        checkCidr("source_networks", "bogus");
        FAIL() << "Expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_EQ(e.field(), "source_networks");
    }
}

// ============================================================================
// Time of day, locale, subject, percent
// ============================================================================

TEST(TimeOfDayTest, AcceptsValidTimes) {
    EXPECT_NO_THROW(checkTimeOfDay("start", "00:00:00"));
    EXPECT_NO_THROW(checkTimeOfDay("start", "09:30:15"));
    EXPECT_NO_THROW(checkTimeOfDay("end", "23:59:59"));
}

TEST(TimeOfDayTest, RejectsInvalidTimes) {
    EXPECT_THROW(checkTimeOfDay("start", "24:00:00"), MalformedInput);
    EXPECT_THROW(checkTimeOfDay("start", "12:60:00"), MalformedInput);
    EXPECT_THROW(checkTimeOfDay("start", "9:30:00"), MalformedInput);
    EXPECT_THROW(checkTimeOfDay("start", "09:30"), MalformedInput);
    EXPECT_THROW(checkTimeOfDay("start", "09-30-00"), MalformedInput);
}

TEST(LocaleTest, AcceptsZoneNames) {
    EXPECT_NO_THROW(checkLocale("locale", "UTC"));
    EXPECT_NO_THROW(checkLocale("locale", "America/New_York"));
    EXPECT_NO_THROW(checkLocale("locale", "Etc/GMT+5"));
}

TEST(LocaleTest, RejectsMalformedNames) {
    EXPECT_THROW(checkLocale("locale", ""), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "/UTC"), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "Europe//Paris"), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "../etc/passwd"), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "New York"), MalformedInput);
}

TEST(LocaleTest, RejectsUnknownZones) {
    EXPECT_THROW(checkLocale("locale", "Not/AZone"), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "Mars/Olympus_Mons"), MalformedInput);
    EXPECT_THROW(checkLocale("locale", "XYZ"), MalformedInput);
}

TEST(SubjectTest, AcceptsSubjectsAndWildcards) {
    EXPECT_NO_THROW(checkSubject("pub", "orders"));
    EXPECT_NO_THROW(checkSubject("pub", "orders.*.created"));
    EXPECT_NO_THROW(checkSubject("pub", "$SYS.REQ.ACCOUNT.*.*"));
    EXPECT_NO_THROW(checkSubject("pub", ">"));
    EXPECT_NO_THROW(checkSubject("pub", "_INBOX.>"));
}

TEST(SubjectTest, RejectsMalformedSubjects) {
    EXPECT_THROW(checkSubject("pub", ""), MalformedInput);
    EXPECT_THROW(checkSubject("pub", "orders..created"), MalformedInput);
    EXPECT_THROW(checkSubject("pub", "orders."), MalformedInput);
    EXPECT_THROW(checkSubject("pub", "orders created"), MalformedInput);
    EXPECT_THROW(checkSubject("pub", "orders.>.created"), MalformedInput);
    EXPECT_THROW(checkSubject("pub", "orders.a*"), MalformedInput);
}

TEST(PercentTest, Bounds) {
    EXPECT_NO_THROW(checkPercent("sampling", 0));
    EXPECT_NO_THROW(checkPercent("sampling", 100));
    EXPECT_THROW(checkPercent("sampling", -1), MalformedInput);
    EXPECT_THROW(checkPercent("sampling", 101), MalformedInput);
}

// ============================================================================
// Durations
// ============================================================================

TEST(DurationTest, ParsesSingleUnits) {
    EXPECT_EQ(parseDuration("ttl", "0"), 0);
    EXPECT_EQ(parseDuration("ttl", "250ns"), 250);
    EXPECT_EQ(parseDuration("ttl", "3us"), 3000);
    EXPECT_EQ(parseDuration("ttl", "3\xC2\xB5s"), 3000);
    EXPECT_EQ(parseDuration("ttl", "500ms"), 500000000);
    EXPECT_EQ(parseDuration("ttl", "2s"), 2000000000);
    EXPECT_EQ(parseDuration("ttl", "5m"), 300000000000);
    EXPECT_EQ(parseDuration("ttl", "1h"), 3600000000000);
}

TEST(DurationTest, ParsesCompoundAndFractional) {
    EXPECT_EQ(parseDuration("ttl", "1h30m"), 5400000000000);
    EXPECT_EQ(parseDuration("ttl", "1m30s"), 90000000000);
    EXPECT_EQ(parseDuration("ttl", "1.5s"), 1500000000);
    EXPECT_EQ(parseDuration("ttl", ".5s"), 500000000);
    EXPECT_EQ(parseDuration("ttl", "-2s"), -2000000000);
}

TEST(DurationTest, RejectsMalformed) {
    EXPECT_THROW((void)parseDuration("ttl", ""), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "10"), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "10x"), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "s"), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "1h30"), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "99999999999999999999h"), MalformedInput);
}

TEST(DurationTest, RejectsFractionalOverflow) {
    EXPECT_THROW((void)parseDuration("ttl", "9223372036.9s"), MalformedInput);
    EXPECT_THROW((void)parseDuration("ttl", "2562047h47m16.9s"), MalformedInput);
    EXPECT_EQ(parseDuration("ttl", "9223372036.854775807s"), std::numeric_limits<std::int64_t>::max());
}
