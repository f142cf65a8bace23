#include "ArrowPrimitive.hpp"
#include "PrimitiveDrawing.hpp"
#include "../ColorParser.hpp"
#include "../RenderConfig.hpp"

#include <QPainter>
#include <algorithm>

namespace vantage {

ArrowPrimitive::ArrowPrimitive(const IChartHost& host, const ISeriesApi* backingSeries, std::vector<ArrowShape> arrows)
    : m_resolver(host, backingSeries)
    , m_arrows(std::move(arrows))
    , m_view(&ArrowPrimitive::draw)
{}

void ArrowPrimitive::updateAllViews() {
    auto& out = m_view.geometry().arrows;
    out.clear();

    const QColor defaultColor = ColorParser::parseOr(render::kShapeColor, Qt::blue);
    const QColor defaultText = ColorParser::parseOr(render::kLabelColor, Qt::white);

    for (const auto& arrow : m_arrows) {
        const auto x = m_resolver.timeToX(arrow.time);
        const auto y = m_resolver.priceToY(arrow.price);
        if (!x || !y) continue;

        ArrowItem item;
        item.x = *x;
        item.y = *y;
        item.size = arrow.style.size > 0.0 ? arrow.style.size : 8.0;
        item.direction = arrow.direction;
        item.color = ColorParser::parseOr(arrow.style.color, defaultColor);
        item.borderColor = ColorParser::parseOr(arrow.style.borderColor, item.color);
        item.borderWidth = arrow.style.borderWidth;
        item.text = QString::fromStdString(arrow.style.text);
        item.textColor = ColorParser::parseOr(arrow.style.textColor, defaultText);
        out.push_back(std::move(item));
    }
}

std::optional<AutoscaleInfo> ArrowPrimitive::autoscaleInfo() const {
    if (m_arrows.empty()) return std::nullopt;
    AutoscaleInfo info{m_arrows.front().price, m_arrows.front().price};
    for (const auto& arrow : m_arrows) {
        info.minValue = std::min(info.minValue, arrow.price);
        info.maxValue = std::max(info.maxValue, arrow.price);
    }
    return info;
}

QPolygonF ArrowPrimitive::outline(ArrowDirection direction, double x, double y, double size) {
    const double stem = size * 0.3;
    switch (direction) {
        case ArrowDirection::Up:
            return QPolygonF({QPointF(x, y - size), QPointF(x - size * 0.7, y + size * 0.5),
                              QPointF(x + size * 0.7, y + size * 0.5)});
        case ArrowDirection::Down:
            return QPolygonF({QPointF(x, y + size), QPointF(x - size * 0.7, y - size * 0.5),
                              QPointF(x + size * 0.7, y - size * 0.5)});
        case ArrowDirection::Left:
            return QPolygonF({QPointF(x - size, y), QPointF(x + size * 0.5, y - size * 0.7),
                              QPointF(x + size * 0.5, y + size * 0.7)});
        case ArrowDirection::Right:
            return QPolygonF({QPointF(x + size, y), QPointF(x - size * 0.5, y - size * 0.7),
                              QPointF(x - size * 0.5, y + size * 0.7)});
        case ArrowDirection::ArrowUp:
            return QPolygonF({QPointF(x, y - size), QPointF(x - size * 0.7, y - size * 0.3),
                              QPointF(x - stem, y - size * 0.3), QPointF(x - stem, y + size),
                              QPointF(x + stem, y + size), QPointF(x + stem, y - size * 0.3),
                              QPointF(x + size * 0.7, y - size * 0.3)});
        case ArrowDirection::ArrowDown:
            return QPolygonF({QPointF(x, y + size), QPointF(x - size * 0.7, y + size * 0.3),
                              QPointF(x - stem, y + size * 0.3), QPointF(x - stem, y - size),
                              QPointF(x + stem, y - size), QPointF(x + stem, y + size * 0.3),
                              QPointF(x + size * 0.7, y + size * 0.3)});
    }
    return {};
}

void ArrowPrimitive::draw(const ArrowGeometry& geometry, BitmapScope& scope) {
    QPainter& painter = *scope.painter;
    const double hr = scope.horizontalPixelRatio;
    const double vr = scope.verticalPixelRatio;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const auto& arrow : geometry.arrows) {
        const double x = arrow.x * hr;
        const double y = arrow.y * vr;
        const double size = arrow.size * std::min(hr, vr);

        if (arrow.borderWidth > 0.0) {
            painter.setPen(QPen(arrow.borderColor, arrow.borderWidth * hr));
        } else {
            painter.setPen(Qt::NoPen);
        }
        painter.setBrush(arrow.color);
        painter.drawPolygon(outline(arrow.direction, x, y, size));

        if (arrow.text.isEmpty()) continue;

        QPointF textPos(x, y);
        switch (arrow.direction) {
            case ArrowDirection::Up:
            case ArrowDirection::ArrowUp:   textPos.ry() = y - size - 8.0 * vr; break;
            case ArrowDirection::Down:
            case ArrowDirection::ArrowDown: textPos.ry() = y + size + 8.0 * vr; break;
            case ArrowDirection::Left:      textPos.rx() = x - size - 8.0 * hr; break;
            case ArrowDirection::Right:     textPos.rx() = x + size + 8.0 * hr; break;
        }
        PrimitiveDrawing::drawLabel(painter, textPos, arrow.text, arrow.textColor,
                                    render::kArrowLabelPx * vr, Qt::AlignHCenter | Qt::AlignVCenter);
    }

    painter.restore();
}

} // namespace vantage
