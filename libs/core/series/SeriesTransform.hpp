/*
Vantage — SeriesTransform
Role: The shared point pipeline every overlay series goes through before it reaches the host.
Inputs/Outputs: Raw JSON point arrays from producers; outputs strictly ascending, duplicate-free
  SeriesPoint vectors, joined marker streams and MarkerSpec lists.
Threading: Stateless; all functions are pure.
Performance: O(n log n) per call (one sort after de-duplication).
Integration: Called by SeriesOverlayRegistry for add/update and by the realtime router for ticks.
Observability: None here; the registry logs when a pipeline run yields nothing.
Related: SeriesTransform.cpp, OverlayTypes.hpp, TimeNormalizer.hpp.
Assumptions: A scalar value of exactly 0 means "no data" and is dropped.
*/
#pragma once
#include "../model/OverlayTypes.hpp"

#include "../VantageJson.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vantage {

class SeriesTransform {
public:
    static constexpr const char* kDefaultColor = "#2962FF";
    static constexpr const char* kNegativeHistogramColor = "#ef5350";

    // Full pipeline: extract, validate, drop zero, de-dup (last wins), sort ascending
    static std::vector<SeriesPoint> apply(const Json& points,
                                          const std::string& seriesId,
                                          SeriesKind kind,
                                          const std::string& color = kDefaultColor);

    static std::optional<SeriesPoint> transformPoint(const Json& point,
                                                     const std::string& seriesId,
                                                     SeriesKind kind,
                                                     const std::string& color);

    static std::vector<SeriesPoint> dedupAndSort(std::vector<SeriesPoint> points);

    // "indicator_sma" -> "sma", "strategy_x_trend" -> "x_trend"
    static std::string baseIdFor(const std::string& seriesId);

    // Value lookup for scalar kinds: nested values{} first, then value/val/v
    static std::optional<double> scalarValue(const Json& point,
                                             const std::string& baseId,
                                             const std::string& seriesId);

    // Exact-time inner join of two {time, value} arrays into
    // [{time, <field1>: v1, <field2>: v2}], ascending by time
    static Json joinByTime(const Json& array1,
                                     const Json& array2,
                                     const std::string& field1Name,
                                     const std::string& field2Name);

    // Condition filter + price resolution for marker-kind series
    static std::vector<MarkerSpec> buildMarkers(const Json& points,
                                                const MarkerSeriesConfig& config);

    static bool isStrictlyAscending(const std::vector<SeriesPoint>& points);
};

} // namespace vantage
