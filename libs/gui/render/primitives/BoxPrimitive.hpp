#pragma once
#include "PrimitivePaneView.hpp"
#include "../ShapeCoordinateResolver.hpp"

#include <QColor>
#include <QString>
#include <vector>

namespace vantage {

struct BoxItem {
    double x1 = 0.0;
    double x2 = 0.0;
    double y1 = 0.0;
    double y2 = 0.0;
    QColor background;
    bool hasBorder = false;
    QColor borderColor;
    double borderWidth = 1.0;
    DashStyle borderStyle = DashStyle::Solid;
    QString text;
    QColor textColor;
};

struct BoxGeometry {
    std::vector<BoxItem> boxes;
};

// Rectangles between two (time, price) corners; zones, order blocks, gaps
class BoxPrimitive : public IPanePrimitive {
public:
    BoxPrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<BoxShape> boxes);

    void updateAllViews() override;
    std::vector<IPaneView*> paneViews() override { return {&m_view}; }
    std::optional<AutoscaleInfo> autoscaleInfo() const override;

    const std::vector<BoxShape>& boxes() const { return m_boxes; }
    const BoxGeometry& geometry() const { return m_view.geometry(); }

private:
    static void draw(const BoxGeometry& geometry, BitmapScope& scope);

    ShapeCoordinateResolver m_resolver;
    std::vector<BoxShape> m_boxes;
    GeometryPaneView<BoxGeometry> m_view;
};

} // namespace vantage
