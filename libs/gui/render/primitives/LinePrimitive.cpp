#include "LinePrimitive.hpp"
#include "PrimitiveDrawing.hpp"
#include "../ColorParser.hpp"
#include "../RenderConfig.hpp"
#include "../../../core/VantageLogging.hpp"

#include <QPainter>
#include <QPainterPath>
#include <algorithm>
#include <iterator>

namespace vantage {

LinePrimitive::LinePrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<LineShape> lines)
    : m_resolver(host, backingSeries)
    , m_lines(std::move(lines))
    , m_view(&LinePrimitive::draw)
{}

void LinePrimitive::updateAllViews() {
    LineGeometry& geometry = m_view.geometry();
    geometry.groups.clear();
    geometry.labels.clear();

    const auto visible = render::kCullOffscreenShapes ? m_resolver.visibleTimeRange() : std::nullopt;
    const QColor defaultColor = ColorParser::parseOr(render::kShapeColor, Qt::blue);

    int culled = 0;
    int unresolved = 0;
    for (const auto& line : m_lines) {
        if (visible) {
            const UnixTime lo = std::min(line.time1, line.time2);
            const UnixTime hi = std::max(line.time1, line.time2);
            if (hi < visible->from || lo > visible->to) {
                ++culled;
                continue;
            }
        }

        const auto x1 = m_resolver.timeToX(line.time1);
        const auto x2 = m_resolver.timeToX(line.time2);
        const auto y1 = m_resolver.priceToY(line.price1);
        const auto y2 = m_resolver.priceToY(line.price2);
        if (!x1 || !x2 || !y1 || !y2) {
            ++unresolved;
            continue;
        }

        const QColor color = ColorParser::parseOr(line.style.color, defaultColor);
        const double width = line.style.lineWidth > 0.0 ? line.style.lineWidth : 1.0;

        auto group = std::find_if(geometry.groups.begin(), geometry.groups.end(), [&](const LineStyleGroup& g) {
            return g.color == color && g.lineWidth == width && g.dash == line.style.lineStyle;
        });
        if (group == geometry.groups.end()) {
            geometry.groups.push_back(LineStyleGroup{color, width, line.style.lineStyle, {}});
            group = std::prev(geometry.groups.end());
        }
        group->segments.emplace_back(*x1, *y1, *x2, *y2);

        if (!line.label.empty()) {
            geometry.labels.push_back(LineLabel{QString::fromStdString(line.label),
                                                QPointF(*x1 + 4.0, *y1 - 4.0), color});
        }
    }

    vLog_Render("Lines:" << m_lines.size() << "groups" << geometry.groups.size()
                << "culled" << culled << "unresolved" << unresolved);
}

std::optional<AutoscaleInfo> LinePrimitive::autoscaleInfo() const {
    if (m_lines.empty()) return std::nullopt;
    AutoscaleInfo info{m_lines.front().price1, m_lines.front().price1};
    for (const auto& line : m_lines) {
        info.minValue = std::min({info.minValue, line.price1, line.price2});
        info.maxValue = std::max({info.maxValue, line.price1, line.price2});
    }
    return info;
}

void LinePrimitive::draw(const LineGeometry& geometry, BitmapScope& scope) {
    QPainter& painter = *scope.painter;
    const double hr = scope.horizontalPixelRatio;
    const double vr = scope.verticalPixelRatio;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const auto& group : geometry.groups) {
        QPainterPath path;
        for (const auto& segment : group.segments) {
            path.moveTo(segment.x1() * hr, segment.y1() * vr);
            path.lineTo(segment.x2() * hr, segment.y2() * vr);
        }
        QPen pen(group.color, group.lineWidth * hr);
        pen.setCapStyle(Qt::FlatCap);
        PrimitiveDrawing::applyDash(pen, group.dash, hr);
        painter.strokePath(path, pen);
    }

    for (const auto& label : geometry.labels) {
        PrimitiveDrawing::drawLabel(painter, QPointF(label.position.x() * hr, label.position.y() * vr),
                                    label.text, label.color, render::kLineLabelPx * vr,
                                    Qt::AlignLeft | Qt::AlignBottom);
    }

    painter.restore();
}

} // namespace vantage
