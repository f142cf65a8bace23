/*
Vantage — TimeNormalizer
Role: Converts every time representation upstream producers send into integer Unix seconds.
Inputs/Outputs: JSON numbers (seconds or milliseconds), numeric strings, ISO-8601 strings,
  business-day objects {year, month, day}; outputs std::optional<UnixTime>.
Threading: Pure functions, callable from any thread.
Performance: No allocation for numeric inputs; ISO parsing is a single forward scan.
Integration: Used by SeriesTransform, ShapeParser and the push dispatcher before any lookup.
Observability: No internal logging; callers log the dropped element.
Related: TimeNormalizer.cpp, SeriesTransform.hpp, ShapeParser.hpp.
Assumptions: Numbers above kMillisecondThreshold (2100-01-01 in seconds) are milliseconds.
  ISO strings without an offset are read as UTC.
*/
#pragma once
#include "../VantageJson.hpp"
#include <cstdint>
#include <optional>
#include <string_view>

namespace vantage {

using UnixTime = std::int64_t;

class TimeNormalizer {
public:
    // 2100-01-01T00:00:00Z in seconds
    static constexpr std::int64_t kMillisecondThreshold = 4102444800LL;

    static std::optional<UnixTime> normalize(const Json& value);
    // nullopt when the value is not finite or the seconds do not fit UnixTime
    static std::optional<UnixTime> fromNumber(double value);
    static std::optional<UnixTime> parseISO8601(std::string_view text);
    static std::optional<UnixTime> fromBusinessDay(int year, unsigned month, unsigned day);

    // First present of "time", "timestamp", "t" on a point object
    static std::optional<UnixTime> pointTime(const Json& point);
};

} // namespace vantage
