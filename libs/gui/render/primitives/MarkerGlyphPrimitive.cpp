#include "MarkerGlyphPrimitive.hpp"
#include "PrimitiveDrawing.hpp"
#include "../ColorParser.hpp"
#include "../RenderConfig.hpp"

#include <QPainter>
#include <QPainterPath>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace vantage {

MarkerGlyphPrimitive::MarkerGlyphPrimitive(const IChartHost& host, const ISeriesApi* backingSeries,
                                           std::vector<MarkerGlyphShape> glyphs)
    : m_resolver(host, backingSeries)
    , m_glyphs(std::move(glyphs))
    , m_view(&MarkerGlyphPrimitive::draw)
{}

void MarkerGlyphPrimitive::updateAllViews() {
    auto& out = m_view.geometry().glyphs;
    out.clear();

    const auto visible = render::kCullOffscreenShapes ? m_resolver.visibleTimeRange() : std::nullopt;
    const QColor defaultColor = ColorParser::parseOr(render::kShapeColor, Qt::blue);
    const QColor defaultText = ColorParser::parseOr(render::kLabelColor, Qt::white);

    for (const auto& glyph : m_glyphs) {
        if (visible && (glyph.time < visible->from || glyph.time > visible->to)) continue;

        const auto x = m_resolver.timeToX(glyph.time);
        const auto y = m_resolver.priceToY(glyph.price);
        if (!x || !y) continue;

        GlyphItem item;
        item.x = *x;
        item.y = *y;
        item.shape = glyph.shape;
        item.size = glyph.style.size > 0.0 ? glyph.style.size : 6.0;
        item.color = ColorParser::parseOr(glyph.style.color, defaultColor);
        item.borderColor = ColorParser::parseOr(glyph.style.borderColor, item.color);
        item.borderWidth = glyph.style.borderWidth;
        item.opacity = std::clamp(glyph.style.opacity, 0.0, 1.0);
        item.text = QString::fromStdString(glyph.text);
        item.textColor = ColorParser::parseOr(glyph.textColor, defaultText);
        out.push_back(std::move(item));
    }
}

std::optional<AutoscaleInfo> MarkerGlyphPrimitive::autoscaleInfo() const {
    if (m_glyphs.empty()) return std::nullopt;
    AutoscaleInfo info{m_glyphs.front().price, m_glyphs.front().price};
    for (const auto& glyph : m_glyphs) {
        info.minValue = std::min(info.minValue, glyph.price);
        info.maxValue = std::max(info.maxValue, glyph.price);
    }
    return info;
}

void MarkerGlyphPrimitive::draw(const GlyphGeometry& geometry, BitmapScope& scope) {
    QPainter& painter = *scope.painter;
    const double hr = scope.horizontalPixelRatio;
    const double vr = scope.verticalPixelRatio;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    for (const auto& glyph : geometry.glyphs) {
        const double x = glyph.x * hr;
        const double y = glyph.y * vr;
        const double size = glyph.size * std::min(hr, vr);

        painter.setOpacity(glyph.opacity);

        if (glyph.shape == GlyphShape::X) {
            // Stroke only; border width doubles as the stroke width
            const double width = (glyph.borderWidth > 0.0 ? glyph.borderWidth : 2.0) * hr;
            painter.setPen(QPen(glyph.color, width));
            painter.drawLine(QPointF(x - size, y - size), QPointF(x + size, y + size));
            painter.drawLine(QPointF(x + size, y - size), QPointF(x - size, y + size));
        } else {
            QPainterPath path;
            switch (glyph.shape) {
                case GlyphShape::Circle:
                    path.addEllipse(QPointF(x, y), size, size);
                    break;
                case GlyphShape::Square:
                    path.addRect(x - size, y - size, size * 2, size * 2);
                    break;
                case GlyphShape::Diamond:
                    path.addPolygon(QPolygonF({QPointF(x, y - size), QPointF(x + size, y),
                                               QPointF(x, y + size), QPointF(x - size, y)}));
                    path.closeSubpath();
                    break;
                case GlyphShape::Triangle:
                    path.addPolygon(QPolygonF({QPointF(x, y - size), QPointF(x - size * 0.866, y + size * 0.5),
                                               QPointF(x + size * 0.866, y + size * 0.5)}));
                    path.closeSubpath();
                    break;
                case GlyphShape::TriangleDown:
                    path.addPolygon(QPolygonF({QPointF(x, y + size), QPointF(x - size * 0.866, y - size * 0.5),
                                               QPointF(x + size * 0.866, y - size * 0.5)}));
                    path.closeSubpath();
                    break;
                case GlyphShape::Cross: {
                    const double arm = size * 0.3;
                    path.setFillRule(Qt::WindingFill);
                    path.addRect(x - arm, y - size, arm * 2, size * 2);
                    path.addRect(x - size, y - arm, size * 2, arm * 2);
                    break;
                }
                case GlyphShape::Star: {
                    constexpr int kSpikes = 5;
                    const double inner = size * 0.5;
                    double rotation = std::numbers::pi / 2.0 * 3.0;
                    const double step = std::numbers::pi / kSpikes;
                    QPolygonF star;
                    for (int i = 0; i < kSpikes; ++i) {
                        star << QPointF(x + std::cos(rotation) * size, y + std::sin(rotation) * size);
                        rotation += step;
                        star << QPointF(x + std::cos(rotation) * inner, y + std::sin(rotation) * inner);
                        rotation += step;
                    }
                    path.addPolygon(star);
                    path.closeSubpath();
                    break;
                }
                case GlyphShape::X:
                    break;
            }
            painter.fillPath(path, glyph.color);
            if (glyph.borderWidth > 0.0) {
                painter.strokePath(path, QPen(glyph.borderColor, glyph.borderWidth * hr));
            }
        }

        painter.setOpacity(1.0);
        if (!glyph.text.isEmpty()) {
            PrimitiveDrawing::drawLabel(painter, QPointF(x, y + size + 4.0 * vr), glyph.text, glyph.textColor,
                                        render::kGlyphLabelPx * vr, Qt::AlignHCenter | Qt::AlignTop);
        }
    }

    painter.restore();
}

} // namespace vantage
