#include "BoxPrimitive.hpp"
#include "PrimitiveDrawing.hpp"
#include "../ColorParser.hpp"
#include "../RenderConfig.hpp"
#include "../../../core/geometry/PixelPositions.hpp"

#include <QPainter>
#include <algorithm>

namespace vantage {

BoxPrimitive::BoxPrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<BoxShape> boxes)
    : m_resolver(host, backingSeries)
    , m_boxes(std::move(boxes))
    , m_view(&BoxPrimitive::draw)
{}

void BoxPrimitive::updateAllViews() {
    auto& out = m_view.geometry().boxes;
    out.clear();

    const QColor defaultBackground = ColorParser::parseOr(render::kBoxBackground, QColor(33, 150, 243, 25));
    const QColor defaultBorder = ColorParser::parseOr(render::kShapeColor, Qt::blue);
    const QColor defaultText = ColorParser::parseOr(render::kLabelColor, Qt::white);

    for (const auto& box : m_boxes) {
        const auto x1 = m_resolver.timeToX(box.time1);
        const auto x2 = m_resolver.timeToX(box.time2);
        const auto y1 = m_resolver.priceToY(box.price1);
        const auto y2 = m_resolver.priceToY(box.price2);
        if (!x1 || !x2 || !y1 || !y2) continue;

        BoxItem item;
        item.x1 = *x1;
        item.x2 = *x2;
        item.y1 = *y1;
        item.y2 = *y2;
        item.background = ColorParser::parseOr(box.style.backgroundColor, defaultBackground);
        item.hasBorder = !box.style.borderColor.empty() || box.style.borderWidth > 0.0;
        item.borderColor = ColorParser::parseOr(box.style.borderColor, defaultBorder);
        item.borderWidth = box.style.borderWidth > 0.0 ? box.style.borderWidth : 1.0;
        item.borderStyle = box.style.borderStyle;
        item.text = QString::fromStdString(box.style.text);
        item.textColor = ColorParser::parseOr(box.style.textColor, defaultText);
        out.push_back(std::move(item));
    }
}

std::optional<AutoscaleInfo> BoxPrimitive::autoscaleInfo() const {
    if (m_boxes.empty()) return std::nullopt;
    AutoscaleInfo info{m_boxes.front().price1, m_boxes.front().price1};
    for (const auto& box : m_boxes) {
        info.minValue = std::min({info.minValue, box.price1, box.price2});
        info.maxValue = std::max({info.maxValue, box.price1, box.price2});
    }
    return info;
}

void BoxPrimitive::draw(const BoxGeometry& geometry, BitmapScope& scope) {
    QPainter& painter = *scope.painter;
    const double hr = scope.horizontalPixelRatio;
    const double vr = scope.verticalPixelRatio;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, false);

    for (const auto& box : geometry.boxes) {
        const auto h = positionsBox(box.x1, box.x2, hr);
        const auto v = positionsBox(box.y1, box.y2, vr);
        const QRect rect(h.position, v.position, h.length, v.length);

        painter.fillRect(rect, box.background);

        if (box.hasBorder) {
            QPen pen(box.borderColor, box.borderWidth * hr);
            pen.setJoinStyle(Qt::MiterJoin);
            PrimitiveDrawing::applyDash(pen, box.borderStyle, hr);
            painter.setPen(pen);
            painter.setBrush(Qt::NoBrush);
            painter.drawRect(rect);
        }

        if (!box.text.isEmpty()) {
            PrimitiveDrawing::drawLabel(painter, QPointF(h.position + 4.0 * hr, v.position + 4.0 * vr),
                                        box.text, box.textColor, render::kBoxLabelPx * vr,
                                        Qt::AlignLeft | Qt::AlignTop);
        }
    }

    painter.restore();
}

} // namespace vantage
