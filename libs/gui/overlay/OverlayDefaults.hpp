#pragma once
#include <QColor>
#include "../../core/VantageJson.hpp"

namespace vantage {

// Styling applied when a producer leaves a field out
struct OverlayDefaults {
    static QColor seriesColor() { return QColor(0x29, 0x62, 0xFF); }
    static QColor markerColor() { return QColor(0x21, 0x96, 0xF3); }
    static QColor candleUpColor() { return QColor(0x4c, 0xaf, 0x50); }
    static QColor candleDownColor() { return QColor(0xe9, 0x1e, 0x63); }

    static constexpr int kLineWidth = 2;
    static constexpr double kSeparatePaneMarginTop = 0.8;
    static constexpr double kSeparatePaneMarginBottom = 0.0;

    // Area / baseline fills derive from the series colour with these alphas
    static constexpr int kAreaTopAlpha = 0x80;
    static constexpr int kBaselineFillAlpha = 0x40;

    // Strategy helper styles: {"color", "lineWidth", "lineStyle"}
    static Json strategySignalsStyle() { return {{"color", "#ff9800"}, {"lineWidth", 1}}; }
    static Json strategyTrendStyle() { return {{"color", "#9c27b0"}, {"lineWidth", 2}, {"lineStyle", 2}}; }
    static Json strategyLevelsStyle() { return {{"color", "#2196f3"}, {"lineWidth", 1}, {"lineStyle", 2}}; }
    static Json strategyCustomStyle() { return {{"color", "#607d8b"}, {"lineWidth", 1}}; }
};

// Deferred shape attachment while the host has not laid out its first frame
struct AttachSchedulerConfig {
    int readyDelayMs = 100;     // first retry when the host is not ready yet
    int staggerStepMs = 50;     // added per queued attachment so batches do not land in one frame
    int maxDelayMs = 2000;      // upper bound on any single wait
};

} // namespace vantage
