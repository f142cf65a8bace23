#pragma once
#include "PrimitivePaneView.hpp"
#include "../ShapeCoordinateResolver.hpp"

#include <QColor>
#include <QPolygonF>
#include <QString>
#include <vector>

namespace vantage {

struct ArrowItem {
    double x = 0.0;
    double y = 0.0;
    double size = 8.0;
    ArrowDirection direction = ArrowDirection::Up;
    QColor color;
    QColor borderColor;
    double borderWidth = 0.0;
    QString text;
    QColor textColor;
};

struct ArrowGeometry {
    std::vector<ArrowItem> arrows;
};

// Directional glyphs anchored at (time, price): signals, breakouts
class ArrowPrimitive : public IPanePrimitive {
public:
    ArrowPrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<ArrowShape> arrows);

    void updateAllViews() override;
    std::vector<IPaneView*> paneViews() override { return {&m_view}; }
    std::optional<AutoscaleInfo> autoscaleInfo() const override;

    const std::vector<ArrowShape>& arrows() const { return m_arrows; }
    const ArrowGeometry& geometry() const { return m_view.geometry(); }

    // Outline around the bitmap-space anchor (x, y) for a glyph of bitmap size `size`
    static QPolygonF outline(ArrowDirection direction, double x, double y, double size);

private:
    static void draw(const ArrowGeometry& geometry, BitmapScope& scope);

    ShapeCoordinateResolver m_resolver;
    std::vector<ArrowShape> m_arrows;
    GeometryPaneView<ArrowGeometry> m_view;
};

} // namespace vantage
