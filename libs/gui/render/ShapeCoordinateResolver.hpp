#pragma once
#include "../host/ChartHost.hpp"

#include <optional>

namespace vantage {

/**
 * Domain -> media pixel conversion for shape primitives.
 *
 * Times go through the host's timeToCoordinate first. Times the time scale does
 * not carry (shape anchors between bars, stale ticks) fall back to the nearest bar
 * of the backing candle data, converted with logicalToCoordinate.
 */
class ShapeCoordinateResolver {
public:
    ShapeCoordinateResolver(const IChartHost& host, const ISeriesApi* backingSeries)
        : m_host(host), m_backing(backingSeries) {}

    std::optional<double> timeToX(UnixTime time) const {
        if (auto x = m_host.timeToCoordinate(time)) return x;
        if (!m_backing) return std::nullopt;
        auto index = BarLookup::nearestBarIndex(m_backing->data(), time);
        if (!index) return std::nullopt;
        return m_host.logicalToCoordinate(static_cast<double>(*index));
    }

    std::optional<double> priceToY(double price) const {
        return m_host.priceToCoordinate(price);
    }

    // Visible logical range mapped onto the backing data's times
    std::optional<TimeRange> visibleTimeRange() const {
        auto range = m_host.visibleLogicalRange();
        if (!range || !m_backing) return std::nullopt;
        return BarLookup::visibleTimeRange(m_backing->data(), *range);
    }

    const IChartHost& host() const { return m_host; }
    const ISeriesApi* backingSeries() const { return m_backing; }

private:
    const IChartHost& m_host;
    const ISeriesApi* m_backing;
};

} // namespace vantage
