#include "FillBetweenPrimitive.hpp"
#include "../ColorParser.hpp"
#include "../../../core/VantageLogging.hpp"
#include "../../../core/geometry/PixelPositions.hpp"

#include <QLinearGradient>
#include <QPainter>
#include <QTransform>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace vantage {

FillBetweenPrimitive::FillBetweenPrimitive(const IChartHost& host, const ISeriesApi* backingSeries,
                                           FillRegion region, ConditionalColor conditionalColor)
    : m_resolver(host, backingSeries)
    , m_conditionalColor(std::move(conditionalColor))
    , m_view(&FillBetweenPrimitive::draw)
{
    updateOptions(region);
}

// =============================================================================
// SOURCES / OPTIONS
// =============================================================================

void FillBetweenPrimitive::validate(const FillRegion& region) {
    if (region.mode == FillMode::HLine &&
        (!std::holds_alternative<ConstantLevel>(region.source1) ||
         !std::holds_alternative<ConstantLevel>(region.source2))) {
        throw std::invalid_argument("hline fill needs two constant levels");
    }
}

FillBetweenPrimitive::Lookup FillBetweenPrimitive::buildLookup(const FillSource& source) {
    Lookup lookup;
    if (const auto* series = std::get_if<ExternalSeries>(&source)) {
        lookup.reserve(series->points.size());
        for (const auto& [time, value] : series->points) {
            lookup[time] = value;
        }
    }
    return lookup;
}

void FillBetweenPrimitive::updateSourceData(FillSource source1, FillSource source2) {
    FillRegion region = m_region;
    region.source1 = std::move(source1);
    region.source2 = std::move(source2);
    updateOptions(region);
}

void FillBetweenPrimitive::updateOptions(const FillRegion& region) {
    validate(region);
    m_region = region;
    m_lookup1 = buildLookup(m_region.source1);
    m_lookup2 = buildLookup(m_region.source2);

    const FillPalette& palette = m_region.palette;
    m_color = ColorParser::parseOr(palette.color, QColor(41, 98, 255, 25));
    m_upColor = ColorParser::parseOr(palette.up, QColor(76, 175, 80, 38));
    m_downColor = ColorParser::parseOr(palette.down, QColor(239, 83, 80, 38));
    m_neutralColor = ColorParser::parseOr(palette.neutral, QColor(158, 158, 158, 25));
    m_topColor = ColorParser::parseOr(palette.top, m_color);
    m_bottomColor = ColorParser::parseOr(palette.bottom, m_color);
}

std::optional<double> FillBetweenPrimitive::resolve(const FillSource& source, const Lookup& lookup,
                                                    const SeriesPoint& bar) {
    if (const auto* level = std::get_if<ConstantLevel>(&source)) {
        return level->value;
    }
    if (const auto* component = std::get_if<PriceComponent>(&source)) {
        if (bar.ohlc) return priceComponentValue(*component, *bar.ohlc);
        return bar.value;
    }
    auto it = lookup.find(bar.time);
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

QColor FillBetweenPrimitive::colorFor(const FillStep& step) const {
    switch (m_region.colorMode) {
        case FillColorMode::Static:
        case FillColorMode::Gradient:
            return m_color;
        case FillColorMode::Dynamic:
            if (step.value1 > step.value2) return m_upColor;
            if (step.value1 < step.value2) return m_downColor;
            return m_neutralColor;
        case FillColorMode::Conditional:
            if (m_conditionalColor) {
                if (auto color = m_conditionalColor(step)) return *color;
            }
            return m_color;
    }
    return m_color;
}

// =============================================================================
// VIEWS
// =============================================================================

void FillBetweenPrimitive::updateAllViews() {
    FillGeometry& geometry = m_view.geometry();
    geometry.quads.clear();
    geometry.band.reset();

    if (!m_region.display) return;

    if (m_region.mode == FillMode::HLine) {
        updateBand(geometry);
    } else {
        updateQuads(geometry);
    }
}

void FillBetweenPrimitive::updateBand(FillGeometry& geometry) {
    const double level1 = std::get<ConstantLevel>(m_region.source1).value;
    const double level2 = std::get<ConstantLevel>(m_region.source2).value;
    const auto y1 = m_resolver.priceToY(level1);
    const auto y2 = m_resolver.priceToY(level2);
    if (!y1 || !y2) return;

    FillBand band;
    band.top = std::min(*y1, *y2);
    band.bottom = std::max(*y1, *y2);
    // A band has no source order: the upper level always plays source1
    band.color = colorFor(FillStep{-1, 0, std::max(level1, level2), std::min(level1, level2)});
    band.gradient = m_region.colorMode == FillColorMode::Gradient;
    band.topColor = m_topColor;
    band.bottomColor = m_bottomColor;
    geometry.band = band;
}

void FillBetweenPrimitive::updateQuads(FillGeometry& geometry) {
    const ISeriesApi* backing = m_resolver.backingSeries();
    if (!backing) return;
    const auto& data = backing->data();
    const auto range = m_resolver.host().visibleLogicalRange();
    if (!range || data.size() < 2) return;

    const int last = static_cast<int>(data.size()) - 1;
    const int from = std::max(0, static_cast<int>(std::floor(range->from)) - 1);
    const int to = std::min(last, static_cast<int>(std::ceil(range->to)) + 1);

    // Both sources at one bar; a single gap is bridged when fillGaps is on
    auto endpoint = [this](const SeriesPoint& bar) -> std::optional<std::pair<double, double>> {
        auto v1 = resolve(m_region.source1, m_lookup1, bar);
        auto v2 = resolve(m_region.source2, m_lookup2, bar);
        if (!v1 && !v2) return std::nullopt;
        if (!v1 || !v2) {
            if (!m_region.fillGaps) return std::nullopt;
            if (!v1) v1 = v2;
            if (!v2) v2 = v1;
        }
        return std::make_pair(*v1, *v2);
    };

    int gaps = 0;
    for (int i = from; i < to; ++i) {
        const SeriesPoint& current = data[i];
        const SeriesPoint& next = data[i + 1];

        const auto a = endpoint(current);
        const auto b = endpoint(next);
        if (!a || !b) {
            ++gaps;
            continue;
        }

        const auto x1 = m_resolver.timeToX(current.time);
        const auto x2 = m_resolver.timeToX(next.time);
        const auto y1a = m_resolver.priceToY(a->first);
        const auto y2a = m_resolver.priceToY(a->second);
        const auto y1b = m_resolver.priceToY(b->first);
        const auto y2b = m_resolver.priceToY(b->second);
        if (!x1 || !x2 || !y1a || !y2a || !y1b || !y2b) continue;

        FillQuad quad;
        quad.polygon << QPointF(*x1, *y1a) << QPointF(*x2, *y1b) << QPointF(*x2, *y2b) << QPointF(*x1, *y2a);
        quad.color = colorFor(FillStep{i, current.time, a->first, a->second});
        quad.gradient = m_region.colorMode == FillColorMode::Gradient;
        quad.topColor = m_topColor;
        quad.bottomColor = m_bottomColor;
        geometry.quads.push_back(std::move(quad));
    }

    vLog_Render("Fill quads:" << geometry.quads.size() << "gaps" << gaps);
}

std::optional<AutoscaleInfo> FillBetweenPrimitive::autoscaleInfo() const {
    if (m_region.mode != FillMode::HLine || !m_region.display) return std::nullopt;
    const double level1 = std::get<ConstantLevel>(m_region.source1).value;
    const double level2 = std::get<ConstantLevel>(m_region.source2).value;
    return AutoscaleInfo{std::min(level1, level2), std::max(level1, level2)};
}

// =============================================================================
// DRAW
// =============================================================================

void FillBetweenPrimitive::draw(const FillGeometry& geometry, BitmapScope& scope) {
    QPainter& painter = *scope.painter;
    const double hr = scope.horizontalPixelRatio;
    const double vr = scope.verticalPixelRatio;

    painter.save();
    painter.setPen(Qt::NoPen);

    if (geometry.band) {
        const FillBand& band = *geometry.band;
        const auto v = positionsBox(band.top, band.bottom, vr);
        const QRect rect(0, v.position, scope.bitmapSize.width(), v.length);
        if (band.gradient) {
            QLinearGradient gradient(0, rect.top(), 0, rect.bottom());
            gradient.setColorAt(0.0, band.topColor);
            gradient.setColorAt(1.0, band.bottomColor);
            painter.fillRect(rect, gradient);
        } else {
            painter.fillRect(rect, band.color);
        }
    }

    if (!geometry.quads.empty()) {
        painter.setRenderHint(QPainter::Antialiasing, true);
        const QTransform toBitmap = QTransform::fromScale(hr, vr);
        for (const auto& quad : geometry.quads) {
            const QPolygonF polygon = toBitmap.map(quad.polygon);
            if (quad.gradient) {
                const QRectF bounds = polygon.boundingRect();
                QLinearGradient gradient(0, bounds.top(), 0, bounds.bottom());
                gradient.setColorAt(0.0, quad.topColor);
                gradient.setColorAt(1.0, quad.bottomColor);
                painter.setBrush(gradient);
            } else {
                painter.setBrush(quad.color);
            }
            painter.drawPolygon(polygon);
        }
    }

    painter.restore();
}

} // namespace vantage
