#pragma once
#include <QColor>

namespace vantage {

// Time and price scale settings of the in-process chart
struct ChartSurfaceConfig {
    int defaultVisibleBars = 250;       // bars shown after the first data load
    double barSpacing = 6.0;            // media px per bar before default zoom
    double minBarSpacing = 0.5;
    double maxBarSpacing = 50.0;
    double rightOffset = 5.0;           // empty bars right of the last bar
    double priceMarginTop = 0.1;        // fraction of pane height
    double priceMarginBottom = 0.1;
    double separatePaneMarginTop = 0.8; // histograms in their own scale
    int priceAxisWidth = 64;            // media px reserved on the right
    int timeAxisHeight = 22;
    QColor background = QColor(0x13, 0x17, 0x22);
    QColor gridColor = QColor(0x2a, 0x2e, 0x39);
    QColor textColor = QColor(0xd1, 0xd4, 0xdc);
};

} // namespace vantage
