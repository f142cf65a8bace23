#pragma once
#include "shape_payloads.hpp"

#include <initializer_list>
#include "VantageJson.hpp"
#include <string>
#include <utility>

/// Indicator API responses: {metadata, series, shapes?}
namespace fixtures {

inline vantage::Json valuePoints(std::initializer_list<std::pair<long long, double>> points) {
    vantage::Json out = vantage::Json::array();
    for (const auto& [time, value] : points) {
        out.push_back({{"time", time}, {"value", value}});
    }
    return out;
}

/// One metadata entry keyed by the indicator's bare name
inline vantage::Json singleSeriesResponse(const std::string& name, const std::string& seriesType = "line") {
    return vantage::Json{
        {"metadata", {
            {name, {{"seriesType", seriesType}, {"displayName", name}, {"config", {{"color", "#ff9800"}}}}}
        }},
        {"series", {
            {name, valuePoints({{1700000000, 101.0}, {1700000060, 102.0}, {1700000120, 103.0}})}
        }}
    };
}

/// Two line sub-series: upper and lower band
inline vantage::Json bandResponse() {
    return vantage::Json{
        {"metadata", {
            {"upper", {{"seriesType", "line"}, {"displayName", "Upper"}}},
            {"lower", {{"seriesType", "line"}, {"displayName", "Lower"}}}
        }},
        {"series", {
            {"upper", valuePoints({{1700000000, 110.0}, {1700000060, 111.0}})},
            {"lower", valuePoints({{1700000000, 90.0}, {1700000060, 91.0}})}
        }}
    };
}

/// Trailing stop line plus a marker series that fires where signal == 1
inline vantage::Json trailResponse() {
    return vantage::Json{
        {"metadata", {
            {"trailingStop", {{"seriesType", "line"}}},
            {"signal", {
                {"seriesType", "marker"},
                {"config", {
                    {"priceField", "trailingStop"},
                    {"conditionField", "signal"},
                    {"conditionValue", 1},
                    {"shape", "triangle"},
                    {"position", "belowBar"},
                    {"color", "#4caf50"}
                }}
            }}
        }},
        {"series", {
            {"trailingStop", valuePoints({{1, 10.0}, {2, 11.0}, {3, 12.0}})},
            {"signal", valuePoints({{1, 1.0}, {2, 0.0}, {4, 1.0}})}
        }}
    };
}

/// Every shape section at once, for isolation and removal tests
inline vantage::Json fullShapes() {
    return vantage::Json{
        {"markers", vantage::Json::array({
            {{"time", 1700000060}, {"position", "aboveBar"}, {"shape", "arrow"}, {"color", "#e91e63"}, {"text", "S"}}
        })},
        {"lines", lines()},
        {"boxes", boxes()},
        {"arrows", arrows()},
        {"markerShapes", markerShapes()},
        {"fills", vantage::Json::array({
            seriesFill(),
            hlineFill(105.0, 95.0),
            {{"enabled", false}, {"mode", "hline"}, {"hline1", 1}, {"hline2", 2}}
        })}
    };
}

} // namespace fixtures
