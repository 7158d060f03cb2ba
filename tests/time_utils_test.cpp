// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the wire time helpers.
//
// Validates:
//   - parseWireTimestamp() across every format the gateway emits
//   - Fixed-offset and named zone suffixes, with US and EU daylight saving
//   - Epoch strings too long for the clock are rejected
//   - Rejection of malformed strings
//   - formatWireDateTime() / formatIso8601() output
//   - ManualClock set/advance
// =============================================================================

#include "twsgate/time/clock.hpp"
#include "twsgate/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using twsgate::formatIso8601;
using twsgate::formatWireDateTime;
using twsgate::parseWireTimestamp;
using twsgate::domain::Timestamp;

namespace {

// 2024-01-05T09:30:00Z
constexpr std::int64_t kOpenBellEpoch = 1704447000;
// 2024-01-05T00:00:00Z
constexpr std::int64_t kMidnightEpoch = 1704412800;

Timestamp epoch(std::int64_t seconds) {
  return Timestamp{std::chrono::seconds{seconds}};
}

}  // namespace

TEST(ParseWireTimestampTest, EpochSeconds) {
  const auto ts = parseWireTimestamp("1704447000");
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(*ts, epoch(kOpenBellEpoch));
}

TEST(ParseWireTimestampTest, BareDateIsUtcMidnight) {
  const auto ts = parseWireTimestamp("20240105");
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(*ts, epoch(kMidnightEpoch));
}

TEST(ParseWireTimestampTest, DateTimeSeparators) {
  for (const char* text : {"20240105 09:30:00", "20240105  09:30:00",
                           "20240105-09:30:00", " 20240105 09:30:00 "}) {
    const auto ts = parseWireTimestamp(text);
    ASSERT_TRUE(ts.has_value()) << text;
    EXPECT_EQ(*ts, epoch(kOpenBellEpoch)) << text;
  }
}

TEST(ParseWireTimestampTest, ZoneSuffixes) {
  EXPECT_EQ(parseWireTimestamp("20240105 09:30:00 UTC"),
            epoch(kOpenBellEpoch));
  EXPECT_EQ(parseWireTimestamp("20240105 10:30:00 +0100"),
            epoch(kOpenBellEpoch));
  EXPECT_EQ(parseWireTimestamp("20240105 04:30:00 -05:00"),
            epoch(kOpenBellEpoch));
  EXPECT_EQ(parseWireTimestamp("20240105 04:30:00 US/Eastern"),
            epoch(kOpenBellEpoch));
  EXPECT_EQ(parseWireTimestamp("20240105 03:30:00 America/Chicago"),
            epoch(kOpenBellEpoch));
  EXPECT_EQ(parseWireTimestamp("20240105 09:30:00 Europe/London"),
            epoch(kOpenBellEpoch));
  // Unlisted names: wall clock read as UTC.
  EXPECT_EQ(parseWireTimestamp("20240105 09:30:00 Mars/Olympus"),
            epoch(kOpenBellEpoch));
}

// -----------------------------------------------------------------------------
// Daylight saving for the named zones.
// -----------------------------------------------------------------------------
TEST(ParseWireTimestampTest, DaylightSavingZones) {
  // 2024-07-01T13:30:00Z and 2024-07-01T09:30:00Z
  EXPECT_EQ(parseWireTimestamp("20240701 09:30:00 US/Eastern"),
            epoch(1719840600));
  EXPECT_EQ(parseWireTimestamp("20240701 10:30:00 Europe/London"),
            epoch(1719826200));

  // US spring forward on 2024-03-10 at 02:00 local.
  EXPECT_EQ(parseWireTimestamp("20240310 01:30:00 US/Eastern"),
            epoch(1710052200));
  EXPECT_EQ(parseWireTimestamp("20240310 03:30:00 US/Eastern"),
            epoch(1710055800));

  // Fall back on 2024-11-03: the repeated hour reads as daylight time.
  EXPECT_EQ(parseWireTimestamp("20241103 01:30:00 US/Eastern"),
            epoch(1730611800));
  EXPECT_EQ(parseWireTimestamp("20241103 02:30:00 US/Eastern"),
            epoch(1730619000));
}

TEST(ParseWireTimestampTest, MalformedInputRejected) {
  EXPECT_FALSE(parseWireTimestamp("").has_value());
  EXPECT_FALSE(parseWireTimestamp("yesterday").has_value());
  EXPECT_FALSE(parseWireTimestamp("20241305").has_value());
  EXPECT_FALSE(parseWireTimestamp("20240105 25:00:00").has_value());
  EXPECT_FALSE(parseWireTimestamp("20240105 09:30").has_value());
}

TEST(ParseWireTimestampTest, EpochLongerThanTenDigitsRejected) {
  EXPECT_EQ(parseWireTimestamp("9999999999"), epoch(9999999999));
  EXPECT_FALSE(parseWireTimestamp("17044470000").has_value());
  EXPECT_FALSE(parseWireTimestamp("99999999999999999999").has_value());
}

TEST(FormatTimeTest, WireAndIsoForms) {
  EXPECT_EQ(formatWireDateTime(epoch(kOpenBellEpoch)), "20240105-09:30:00");
  EXPECT_EQ(formatIso8601(epoch(kOpenBellEpoch)), "2024-01-05T09:30:00Z");
  EXPECT_EQ(formatIso8601(epoch(0)), "1970-01-01T00:00:00Z");
}

TEST(ManualClockTest, SetAndAdvance) {
  twsgate::ManualClock clock(epoch(kMidnightEpoch));
  EXPECT_EQ(clock.now(), epoch(kMidnightEpoch));

  clock.advance(std::chrono::minutes(570));
  EXPECT_EQ(clock.now(), epoch(kOpenBellEpoch));

  clock.set(epoch(0));
  EXPECT_EQ(clock.now(), epoch(0));
}
