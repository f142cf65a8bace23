#pragma once
#include "PrimitivePaneView.hpp"
#include "../ShapeCoordinateResolver.hpp"

#include <QColor>
#include <QString>
#include <vector>

namespace vantage {

struct GlyphItem {
    double x = 0.0;
    double y = 0.0;
    GlyphShape shape = GlyphShape::Circle;
    double size = 6.0;
    QColor color;
    QColor borderColor;
    double borderWidth = 0.0;
    double opacity = 1.0;
    QString text;
    QColor textColor;
};

struct GlyphGeometry {
    std::vector<GlyphItem> glyphs;
};

// Free-standing shape glyphs at (time, price). Unlike host markers these sit at an
// exact price rather than above/below a bar.
class MarkerGlyphPrimitive : public IPanePrimitive {
public:
    MarkerGlyphPrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<MarkerGlyphShape> glyphs);

    void updateAllViews() override;
    std::vector<IPaneView*> paneViews() override { return {&m_view}; }
    std::optional<AutoscaleInfo> autoscaleInfo() const override;

    const std::vector<MarkerGlyphShape>& glyphs() const { return m_glyphs; }
    const GlyphGeometry& geometry() const { return m_view.geometry(); }

private:
    static void draw(const GlyphGeometry& geometry, BitmapScope& scope);

    ShapeCoordinateResolver m_resolver;
    std::vector<MarkerGlyphShape> m_glyphs;
    GeometryPaneView<GlyphGeometry> m_view;
};

} // namespace vantage
