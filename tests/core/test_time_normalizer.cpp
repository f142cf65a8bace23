/*
Vantage — TimeNormalizer Tests
Role: Verify every upstream time representation lands on the same Unix second
Testing Strategy: One instant expressed in each accepted form → assert identical output
Coverage: Seconds, milliseconds, numeric strings, ISO-8601 with and without offsets,
  business-day objects, point time keys, rejected inputs
*/
#include <gtest/gtest.h>
#include <limits>
#include "time/TimeNormalizer.hpp"

using namespace vantage;

namespace {
// 2023-11-14T22:13:20Z
constexpr UnixTime kInstant = 1700000000;
}

// =============================================================================
// Numeric Inputs
// =============================================================================

TEST(TimeNormalizer, SecondsPassThrough) {
    auto t = TimeNormalizer::normalize(vantage::Json(1700000000));
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, kInstant);
}

TEST(TimeNormalizer, MillisecondsAreDividedDown) {
    auto t = TimeNormalizer::normalize(vantage::Json(1700000000000LL));
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, kInstant);
}

TEST(TimeNormalizer, FractionalValuesAreFloored) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json(1700000000.9)), kInstant);
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json(1700000000999LL)), kInstant);
}

TEST(TimeNormalizer, ThresholdSeparatesSecondsFromMilliseconds) {
    // Exactly at the threshold is still seconds
    EXPECT_EQ(*TimeNormalizer::fromNumber(static_cast<double>(TimeNormalizer::kMillisecondThreshold)),
              TimeNormalizer::kMillisecondThreshold);
    EXPECT_EQ(*TimeNormalizer::fromNumber(static_cast<double>(TimeNormalizer::kMillisecondThreshold) + 1000.0),
              (TimeNormalizer::kMillisecondThreshold + 1000) / 1000);
}

TEST(TimeNormalizer, OutOfRangeNumbersAreRejected) {
    // 1e300 ms is still 1e297 s, far beyond int64
    EXPECT_FALSE(TimeNormalizer::fromNumber(1e300).has_value());
    EXPECT_FALSE(TimeNormalizer::fromNumber(-1e300).has_value());
    EXPECT_FALSE(TimeNormalizer::fromNumber(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json(1e30)).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json(std::string(40, '9'))).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json{{"year", 1e12}, {"month", 1}, {"day", 1}}).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json{{"year", 2024}, {"month", 1e12}, {"day", 1}}).has_value());
}

TEST(TimeNormalizer, NumericStrings) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("1700000000")), kInstant);
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("1700000000000")), kInstant);
}

// =============================================================================
// ISO-8601
// =============================================================================

TEST(TimeNormalizer, IsoWithZuluSuffix) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14T22:13:20Z")), kInstant);
}

TEST(TimeNormalizer, IsoWithOffset) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14T23:13:20+01:00")), kInstant);
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14T17:13:20-0500")), kInstant);
}

TEST(TimeNormalizer, IsoWithoutOffsetIsUtc) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14T22:13:20")), kInstant);
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14 22:13:20")), kInstant);
}

TEST(TimeNormalizer, IsoFractionalSecondsDropped) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2023-11-14T22:13:20.789123456Z")), kInstant);
}

TEST(TimeNormalizer, IsoDateOnlyIsMidnight) {
    EXPECT_EQ(*TimeNormalizer::normalize(vantage::Json("2024-01-01")), 1704067200);
}

TEST(TimeNormalizer, MalformedStringsRejected) {
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json("not a time")).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json("2023-13-01")).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json("2023-11-14T25:00:00Z")).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json("2023-11-14T22:13:20Zjunk")).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json("")).has_value());
}

// =============================================================================
// Business Days and Other Shapes
// =============================================================================

TEST(TimeNormalizer, BusinessDayObject) {
    vantage::Json day = {{"year", 2024}, {"month", 1}, {"day", 1}};
    EXPECT_EQ(*TimeNormalizer::normalize(day), 1704067200);
}

TEST(TimeNormalizer, InvalidBusinessDayRejected) {
    vantage::Json day = {{"year", 2023}, {"month", 2}, {"day", 30}};
    EXPECT_FALSE(TimeNormalizer::normalize(day).has_value());
}

TEST(TimeNormalizer, NonTimeValuesRejected) {
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json()).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json(true)).has_value());
    EXPECT_FALSE(TimeNormalizer::normalize(vantage::Json::array({1, 2})).has_value());
}

TEST(TimeNormalizer, PointTimeKeyPrecedence) {
    EXPECT_EQ(*TimeNormalizer::pointTime({{"timestamp", 1700000000000LL}}), kInstant);
    EXPECT_EQ(*TimeNormalizer::pointTime({{"t", "2023-11-14T22:13:20Z"}}), kInstant);
    // "time" wins over the aliases
    EXPECT_EQ(*TimeNormalizer::pointTime({{"time", 1}, {"timestamp", 2}}), 1);
    EXPECT_FALSE(TimeNormalizer::pointTime({{"value", 3}}).has_value());
}
