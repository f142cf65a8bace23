#pragma once
#include "../model/OverlayTypes.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace vantage {

// Fractional bar ordinals on the host time scale
struct LogicalRange {
    double from = 0.0;
    double to = 0.0;
};

struct TimeRange {
    UnixTime from = 0;
    UnixTime to = 0;
};

namespace BarLookup {

// Exact match if present, otherwise the insertion point clamped to the last bar
inline std::optional<int> nearestBarIndex(const std::vector<SeriesPoint>& bars, UnixTime time) {
    if (bars.empty()) return std::nullopt;
    int left = 0;
    int right = static_cast<int>(bars.size()) - 1;
    while (left <= right) {
        const int mid = left + (right - left) / 2;
        if (bars[mid].time == time) return mid;
        if (bars[mid].time < time) {
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }
    return std::min(left, static_cast<int>(bars.size()) - 1);
}

// Times of the first and last bar covered by a logical range
inline std::optional<TimeRange> visibleTimeRange(const std::vector<SeriesPoint>& bars, const LogicalRange& range) {
    if (bars.empty()) return std::nullopt;
    const int last = static_cast<int>(bars.size()) - 1;
    const int startIdx = std::max(0, static_cast<int>(std::floor(range.from)));
    const int endIdx = std::min(last, static_cast<int>(std::ceil(range.to)));
    if (startIdx > last || endIdx < 0 || startIdx > endIdx) return std::nullopt;
    return TimeRange{bars[startIdx].time, bars[endIdx].time};
}

} // namespace BarLookup
} // namespace vantage
