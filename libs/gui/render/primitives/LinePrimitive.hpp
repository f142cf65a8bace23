/*
Vantage — LinePrimitive
Role: Draws trend lines / levels given as (time, price) endpoint pairs.
Inputs/Outputs: Immutable LineShape list; per-frame stroke groups and labels.
Threading: GUI thread (updateAllViews and draw both run inside the host repaint).
Performance: Lines outside the visible time range are culled before coordinate resolution.
  Lines sharing (color, width, dash) go into one path, so each distinct style costs one stroke.
  Labels are drawn in a single pass after all strokes.
Integration: Created by ShapePrimitiveFactory, attached to the host by SeriesOverlayRegistry.
Observability: vLog_Render with the per-frame drawn/dropped counts.
Related: LinePrimitive.cpp, ShapeCoordinateResolver.hpp, PrimitivePaneView.hpp.
Assumptions: A line whose endpoint cannot be resolved is dropped for the current frame only.
*/
#pragma once
#include "PrimitivePaneView.hpp"
#include "../ShapeCoordinateResolver.hpp"

#include <QColor>
#include <QLineF>
#include <QPointF>
#include <QString>
#include <vector>

namespace vantage {

struct LineStyleGroup {
    QColor color;
    double lineWidth = 1.0;
    DashStyle dash = DashStyle::Solid;
    std::vector<QLineF> segments;   // media px
};

struct LineLabel {
    QString text;
    QPointF position;               // media px, text baseline-left
    QColor color;
};

struct LineGeometry {
    std::vector<LineStyleGroup> groups;
    std::vector<LineLabel> labels;
};

class LinePrimitive : public IPanePrimitive {
public:
    LinePrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<LineShape> lines);

    void updateAllViews() override;
    std::vector<IPaneView*> paneViews() override { return {&m_view}; }
    std::optional<AutoscaleInfo> autoscaleInfo() const override;

    const std::vector<LineShape>& lines() const { return m_lines; }
    const LineGeometry& geometry() const { return m_view.geometry(); }

private:
    static void draw(const LineGeometry& geometry, BitmapScope& scope);

    ShapeCoordinateResolver m_resolver;
    std::vector<LineShape> m_lines;
    GeometryPaneView<LineGeometry> m_view;
};

} // namespace vantage
