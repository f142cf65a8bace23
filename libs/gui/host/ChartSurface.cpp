#include "ChartSurface.hpp"
#include "../render/ColorParser.hpp"
#include "../../core/VantageLogging.hpp"
#include "../../core/series/SeriesTransform.hpp"

#include <QDateTime>
#include <QFont>
#include <QLinearGradient>
#include <QPainter>
#include <QPainterPath>
#include <QPolygonF>
#include <QTimeZone>
#include <algorithm>
#include <cmath>

namespace vantage {

namespace {

const QString kDefaultScaleId = QStringLiteral("right");

QString scaleIdOf(const SeriesOptions& options) {
    return options.priceScaleId.isEmpty() ? kDefaultScaleId : options.priceScaleId;
}

QPen seriesPen(const QColor& color, int width, LineStyle style) {
    QPen pen(color, std::max(1, width));
    switch (style) {
        case LineStyle::Solid:        pen.setStyle(Qt::SolidLine); break;
        case LineStyle::Dotted:       pen.setStyle(Qt::DotLine); break;
        case LineStyle::Dashed:       pen.setStyle(Qt::DashLine); break;
        case LineStyle::LargeDashed:  pen.setDashPattern({6.0, 6.0}); break;
        case LineStyle::SparseDotted: pen.setDashPattern({1.0, 4.0}); break;
    }
    return pen;
}

// 1, 2 or 5 times a power of ten, close to range / targetCount
double niceStep(double range, int targetCount) {
    if (range <= 0.0 || targetCount <= 0) return 1.0;
    const double raw = range / targetCount;
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
    const double residual = raw / magnitude;
    if (residual > 5.0) return 10.0 * magnitude;
    if (residual > 2.0) return 5.0 * magnitude;
    if (residual > 1.0) return 2.0 * magnitude;
    return magnitude;
}

int priceDecimals(double step) {
    if (step >= 1.0) return 2;
    return std::clamp(static_cast<int>(std::ceil(-std::log10(step))) + 1, 2, 8);
}

} // namespace

// =============================================================================
// SERIES
// =============================================================================

class ChartSurface::Series final : public ISeriesApi {
public:
    Series(ChartSurface& owner, SeriesKind kind, SeriesOptions options)
        : m_owner(owner), m_kind(kind), m_options(std::move(options)) {}

    SeriesKind kind() const override { return m_kind; }

    void setData(std::vector<SeriesPoint> points) override {
        if (!SeriesTransform::isStrictlyAscending(points)) {
            vLog_Warning("Series data not strictly ascending, re-sorting" << points.size() << "points");
            points = SeriesTransform::dedupAndSort(std::move(points));
        }
        m_data = std::move(points);
        m_owner.onSeriesDataChanged();
    }

    bool update(const SeriesPoint& point) override {
        if (!m_data.empty() && point.time < m_data.back().time) {
            return false;
        }
        if (!m_data.empty() && point.time == m_data.back().time) {
            m_data.back() = point;
        } else {
            m_data.push_back(point);
        }
        m_owner.onSeriesPointUpdated(point.time);
        return true;
    }

    const std::vector<SeriesPoint>& data() const override { return m_data; }
    const SeriesOptions& options() const override { return m_options; }

    void applyOptions(const SeriesOptions& options) override {
        m_options = options;
        m_owner.requestRepaint();
    }

private:
    ChartSurface& m_owner;
    SeriesKind m_kind;
    SeriesOptions m_options;
    std::vector<SeriesPoint> m_data;
};

// =============================================================================
// NATIVE MARKER LAYER
// =============================================================================

class ChartSurface::NativeMarkerLayer final : public IMarkerLayer {
public:
    NativeMarkerLayer(ChartSurface* owner, const ISeriesApi* series)
        : m_owner(owner), m_series(series) {}

    ~NativeMarkerLayer() override {
        if (m_owner) {
            auto& layers = m_owner->m_markerLayers;
            layers.erase(std::remove(layers.begin(), layers.end(), this), layers.end());
            m_owner->requestRepaint();
        }
    }

    void setMarkers(std::vector<HostMarker> markers) override {
        m_markers = std::move(markers);
        if (m_owner) m_owner->requestRepaint();
    }

    ChartSurface* m_owner;          // cleared when the surface goes first
    const ISeriesApi* m_series;     // cleared when the series is removed
    std::vector<HostMarker> m_markers;
};

// =============================================================================
// CONSTRUCTION / SERIES MANAGEMENT
// =============================================================================

ChartSurface::ChartSurface(ChartSurfaceConfig config)
    : m_config(std::move(config))
    , m_barSpacing(m_config.barSpacing)
{}

ChartSurface::~ChartSurface() {
    for (auto* layer : m_markerLayers) {
        layer->m_owner = nullptr;
    }
    m_markerLayers.clear();
}

ISeriesApi* ChartSurface::addSeries(SeriesKind kind, const SeriesOptions& options) {
    m_series.push_back(std::make_unique<Series>(*this, kind, options));
    m_scalesDirty = true;
    return m_series.back().get();
}

ISeriesApi* ChartSurface::createMainSeries(const SeriesOptions& options) {
    if (m_main) return m_main;
    SeriesOptions mainOptions = options;
    mainOptions.priceScaleId = kDefaultScaleId;
    addSeries(SeriesKind::Candlestick, mainOptions);
    m_main = m_series.back().get();
    vLog_App("Main candle series created");
    return m_main;
}

ISeriesApi* ChartSurface::mainSeries() const {
    return m_main;
}

void ChartSurface::removeSeries(ISeriesApi* series) {
    auto it = std::find_if(m_series.begin(), m_series.end(),
                           [series](const std::unique_ptr<Series>& s) { return s.get() == series; });
    if (it == m_series.end()) return;

    for (auto* layer : m_markerLayers) {
        if (layer->m_series == series) layer->m_series = nullptr;
    }
    if (m_main == it->get()) {
        m_main = nullptr;
        m_readyNotified = false;
        m_defaultZoomApplied = false;
    }
    m_series.erase(it);
    rebuildTimeIndex();
    m_scalesDirty = true;
    requestRepaint();
}

void ChartSurface::onSeriesDataChanged() {
    rebuildTimeIndex();
    m_scalesDirty = true;
    checkReady();
    requestRepaint();
}

void ChartSurface::onSeriesPointUpdated(UnixTime time) {
    if (m_timeIndex.empty() || time > m_timeIndex.back()) {
        const double lastLogical = static_cast<double>(m_timeIndex.size()) - 1.0;
        const bool following = m_timeIndex.empty() || m_rightEdge >= lastLogical + m_config.rightOffset - 0.5;
        m_timeIndex.push_back(time);
        if (m_defaultZoomApplied && following) {
            m_rightEdge += 1.0;
        }
    } else if (!indexOfTime(time)) {
        rebuildTimeIndex();
    }
    m_scalesDirty = true;
    checkReady();
    requestRepaint();
}

void ChartSurface::rebuildTimeIndex() {
    const double lastLogical = static_cast<double>(m_timeIndex.size()) - 1.0;
    const bool following = m_timeIndex.empty() || m_rightEdge >= lastLogical + m_config.rightOffset - 0.5;

    std::vector<UnixTime> merged;
    for (const auto& series : m_series) {
        for (const auto& point : series->data()) {
            merged.push_back(point.time);
        }
    }
    std::sort(merged.begin(), merged.end());
    merged.erase(std::unique(merged.begin(), merged.end()), merged.end());
    m_timeIndex = std::move(merged);

    if (m_defaultZoomApplied && following && !m_timeIndex.empty()) {
        m_rightEdge = static_cast<double>(m_timeIndex.size() - 1) + m_config.rightOffset;
    }
}

std::optional<int> ChartSurface::indexOfTime(UnixTime time) const {
    auto it = std::lower_bound(m_timeIndex.begin(), m_timeIndex.end(), time);
    if (it == m_timeIndex.end() || *it != time) return std::nullopt;
    return static_cast<int>(it - m_timeIndex.begin());
}

// =============================================================================
// READINESS
// =============================================================================

bool ChartSurface::isReady() const {
    const QRectF plot = plotRect();
    return m_main && !m_main->data().empty() && plot.width() > 0 && plot.height() > 0 && m_defaultZoomApplied;
}

void ChartSurface::onReady(std::function<void()> callback) {
    if (!callback) return;
    if (isReady()) {
        callback();
        return;
    }
    m_readyCallbacks.push_back(std::move(callback));
}

void ChartSurface::checkReady() {
    if (!m_defaultZoomApplied && m_main && !m_main->data().empty() && plotRect().width() > 0) {
        applyDefaultZoom();
    }
    if (m_readyNotified || !isReady()) return;

    m_readyNotified = true;
    auto callbacks = std::move(m_readyCallbacks);
    m_readyCallbacks.clear();
    vLog_App("Chart surface ready," << callbacks.size() << "pending callbacks");
    for (auto& cb : callbacks) {
        cb();
    }
}

void ChartSurface::requestRepaint() {
    m_scalesDirty = true;
    if (m_repaintCallback) m_repaintCallback();
}

// =============================================================================
// TIME SCALE
// =============================================================================

void ChartSurface::setViewportSize(const QSizeF& size) {
    if (size == m_viewportSize) return;
    m_viewportSize = size;
    m_scalesDirty = true;
    checkReady();
    requestRepaint();
}

QRectF ChartSurface::plotRect() const {
    const double width = std::max(0.0, m_viewportSize.width() - m_config.priceAxisWidth);
    const double height = std::max(0.0, m_viewportSize.height() - m_config.timeAxisHeight);
    return QRectF(0.0, 0.0, width, height);
}

void ChartSurface::applyDefaultZoom() {
    const double width = plotRect().width();
    if (width <= 0.0 || m_timeIndex.empty()) return;

    const double bars = std::max(1, m_config.defaultVisibleBars) + m_config.rightOffset;
    m_barSpacing = std::clamp(width / bars, m_config.minBarSpacing, m_config.maxBarSpacing);
    m_rightEdge = static_cast<double>(m_timeIndex.size() - 1) + m_config.rightOffset;
    m_defaultZoomApplied = true;
    m_scalesDirty = true;

    vLog_Render("Default zoom:" << m_config.defaultVisibleBars << "bars, spacing" << m_barSpacing);
    requestRepaint();
}

std::optional<double> ChartSurface::logicalToCoordinate(double logical) const {
    const double width = plotRect().width();
    if (width <= 0.0 || m_timeIndex.empty()) return std::nullopt;
    return width - (m_rightEdge - logical + 0.5) * m_barSpacing;
}

std::optional<double> ChartSurface::coordinateToLogical(double x) const {
    const double width = plotRect().width();
    if (width <= 0.0 || m_timeIndex.empty()) return std::nullopt;
    return m_rightEdge + 0.5 - (width - x) / m_barSpacing;
}

std::optional<double> ChartSurface::timeToCoordinate(UnixTime time) const {
    auto index = indexOfTime(time);
    if (!index) return std::nullopt;
    return logicalToCoordinate(static_cast<double>(*index));
}

std::optional<LogicalRange> ChartSurface::visibleLogicalRange() const {
    auto from = coordinateToLogical(0.0);
    auto to = coordinateToLogical(plotRect().width());
    if (!from || !to) return std::nullopt;
    return LogicalRange{*from, *to};
}

std::pair<int, int> ChartSurface::visibleIndexSpan() const {
    auto range = visibleLogicalRange();
    if (!range || m_timeIndex.empty()) return {0, -1};
    const int last = static_cast<int>(m_timeIndex.size()) - 1;
    const int first = std::max(0, static_cast<int>(std::floor(range->from)) - 1);
    const int end = std::min(last, static_cast<int>(std::ceil(range->to)) + 1);
    return {first, end};
}

void ChartSurface::scrollBy(double bars) {
    if (m_timeIndex.empty()) return;
    const double width = plotRect().width();
    const double lastLogical = static_cast<double>(m_timeIndex.size() - 1);
    const double visibleBars = m_barSpacing > 0.0 ? width / m_barSpacing : 0.0;
    // Keep at least one bar on screen
    m_rightEdge = std::clamp(m_rightEdge + bars, 0.0, lastLogical + std::max(visibleBars - 1.0, 0.0));
    m_scalesDirty = true;
    requestRepaint();
}

void ChartSurface::zoomBy(double factor, double anchorX) {
    if (factor <= 0.0) return;
    auto anchor = coordinateToLogical(anchorX);
    if (!anchor) return;

    const double width = plotRect().width();
    m_barSpacing = std::clamp(m_barSpacing * factor, m_config.minBarSpacing, m_config.maxBarSpacing);
    m_rightEdge = *anchor + (width - anchorX) / m_barSpacing - 0.5;
    m_scalesDirty = true;

    vLog_Render("Zoom: spacing" << m_barSpacing << "anchor logical" << *anchor);
    requestRepaint();
}

// =============================================================================
// PRICE SCALES
// =============================================================================

void ChartSurface::rebuildScales() const {
    m_scales.clear();
    m_scalesDirty = false;

    auto [first, last] = visibleIndexSpan();
    if (first > last) return;
    const UnixTime fromTime = m_timeIndex[first];
    const UnixTime toTime = m_timeIndex[last];

    auto extend = [](PriceScale& scale, double value) {
        if (!scale.valid) {
            scale.minValue = scale.maxValue = value;
            scale.valid = true;
        } else {
            scale.minValue = std::min(scale.minValue, value);
            scale.maxValue = std::max(scale.maxValue, value);
        }
    };

    for (const auto& series : m_series) {
        const auto& options = series->options();
        PriceScale& scale = m_scales[scaleIdOf(options)];
        scale.marginTop = options.scaleMarginTop;
        scale.marginBottom = options.scaleMarginBottom;

        const auto& data = series->data();
        auto it = std::lower_bound(data.begin(), data.end(), fromTime,
                                   [](const SeriesPoint& p, UnixTime t) { return p.time < t; });
        for (; it != data.end() && it->time <= toTime; ++it) {
            if (it->ohlc) {
                extend(scale, it->ohlc->low);
                extend(scale, it->ohlc->high);
            } else {
                extend(scale, it->value);
            }
        }
        if (series->kind() == SeriesKind::Histogram && scale.valid) {
            extend(scale, 0.0);
        }
    }

    if (m_main) {
        PriceScale& mainScale = m_scales[scaleIdOf(m_main->options())];
        for (auto* primitive : m_primitives) {
            if (auto info = primitive->autoscaleInfo()) {
                extend(mainScale, info->minValue);
                extend(mainScale, info->maxValue);
            }
        }
    }

    for (auto& [id, scale] : m_scales) {
        if (scale.valid && scale.maxValue == scale.minValue) {
            const double pad = scale.minValue != 0.0 ? std::abs(scale.minValue) * 0.01 : 1.0;
            scale.minValue -= pad;
            scale.maxValue += pad;
        }
    }
}

const ChartSurface::PriceScale* ChartSurface::scaleFor(const QString& scaleId) const {
    if (m_scalesDirty) rebuildScales();
    auto it = m_scales.find(scaleId.isEmpty() ? kDefaultScaleId : scaleId);
    if (it == m_scales.end() || !it->second.valid) return nullptr;
    return &it->second;
}

std::optional<double> ChartSurface::priceToY(const PriceScale& scale, double price) const {
    const double height = plotRect().height();
    if (height <= 0.0 || !scale.valid) return std::nullopt;
    const double usable = height * (1.0 - scale.marginTop - scale.marginBottom);
    if (usable <= 0.0) return std::nullopt;
    return height * scale.marginTop + (scale.maxValue - price) / (scale.maxValue - scale.minValue) * usable;
}

std::optional<double> ChartSurface::priceToCoordinate(const ISeriesApi* series, double price) const {
    if (!series) return std::nullopt;
    const PriceScale* scale = scaleFor(scaleIdOf(series->options()));
    if (!scale) return std::nullopt;
    return priceToY(*scale, price);
}

std::optional<double> ChartSurface::priceToCoordinate(double price) const {
    return priceToCoordinate(m_main, price);
}

// =============================================================================
// PRIMITIVES / MARKER LAYERS
// =============================================================================

void ChartSurface::attachPrimitive(IPanePrimitive* primitive) {
    if (!primitive) return;
    if (std::find(m_primitives.begin(), m_primitives.end(), primitive) != m_primitives.end()) return;
    m_primitives.push_back(primitive);
    requestRepaint();
}

void ChartSurface::detachPrimitive(IPanePrimitive* primitive) {
    m_primitives.erase(std::remove(m_primitives.begin(), m_primitives.end(), primitive), m_primitives.end());
    requestRepaint();
}

std::unique_ptr<IMarkerLayer> ChartSurface::createMarkerLayer(ISeriesApi* series) {
    auto layer = std::make_unique<NativeMarkerLayer>(this, series);
    m_markerLayers.push_back(layer.get());
    return layer;
}

// =============================================================================
// PAINTING
// =============================================================================

void ChartSurface::paint(QPainter& painter, double pixelRatio) {
    painter.fillRect(QRectF(QPointF(0, 0), m_viewportSize), m_config.background);

    const QRectF plot = plotRect();
    if (plot.isEmpty() || m_timeIndex.empty()) return;

    rebuildScales();
    const auto primitives = m_primitives;
    for (auto* primitive : primitives) {
        primitive->updateAllViews();
    }

    painter.save();
    painter.setClipRect(plot);
    painter.setRenderHint(QPainter::Antialiasing, true);

    // Horizontal grid on the main scale
    if (const PriceScale* scale = m_main ? scaleFor(scaleIdOf(m_main->options())) : nullptr) {
        const double step = niceStep(scale->maxValue - scale->minValue, 6);
        painter.setPen(QPen(m_config.gridColor, 1));
        for (double v = std::ceil(scale->minValue / step) * step; v <= scale->maxValue; v += step) {
            if (auto y = priceToY(*scale, v)) painter.drawLine(QPointF(plot.left(), *y), QPointF(plot.right(), *y));
        }
    }

    for (const auto& series : m_series) {
        paintSeries(painter, *series);
    }
    paintPrimitives(painter, pixelRatio);
    paintMarkers(painter);
    painter.restore();

    paintAxes(painter);
}

void ChartSurface::paintSeries(QPainter& painter, const Series& series) const {
    if (series.data().empty()) return;
    const PriceScale* scale = scaleFor(scaleIdOf(series.options()));
    if (!scale) return;

    switch (series.kind()) {
        case SeriesKind::Line:
        case SeriesKind::Area:
        case SeriesKind::Baseline:
            paintLineLike(painter, series, *scale);
            break;
        case SeriesKind::Histogram:
            paintHistogram(painter, series, *scale);
            break;
        case SeriesKind::Bar:
        case SeriesKind::Candlestick:
            paintBars(painter, series, *scale);
            break;
        case SeriesKind::Marker:
            break;
    }

    const auto& options = series.options();
    if (options.priceLineVisible && series.kind() != SeriesKind::Histogram) {
        if (auto y = priceToY(*scale, series.data().back().value)) {
            QPen pen(options.color, 1, Qt::DashLine);
            painter.setPen(pen);
            painter.drawLine(QPointF(0, *y), QPointF(plotRect().width(), *y));
        }
    }
}

void ChartSurface::paintLineLike(QPainter& painter, const Series& series, const PriceScale& scale) const {
    auto [first, last] = visibleIndexSpan();
    if (first > last) return;
    const auto& data = series.data();
    const auto& options = series.options();

    auto it = std::lower_bound(data.begin(), data.end(), m_timeIndex[first],
                               [](const SeriesPoint& p, UnixTime t) { return p.time < t; });
    QPolygonF line;
    std::vector<double> values;
    for (; it != data.end() && it->time <= m_timeIndex[last]; ++it) {
        auto x = timeToCoordinate(it->time);
        auto y = priceToY(scale, it->value);
        if (!x || !y) continue;
        line << QPointF(*x, *y);
        values.push_back(it->value);
    }
    if (line.isEmpty()) return;

    const double bottom = plotRect().height();
    if (series.kind() == SeriesKind::Area && line.size() > 1) {
        QColor top = options.topColor.isValid() ? options.topColor : options.color;
        QColor low = options.bottomColor.isValid() ? options.bottomColor : options.color;
        if (!options.topColor.isValid()) top.setAlphaF(0.4f);
        if (!options.bottomColor.isValid()) low.setAlphaF(0.0f);

        QPolygonF area = line;
        area << QPointF(line.last().x(), bottom) << QPointF(line.first().x(), bottom);
        QLinearGradient gradient(0, 0, 0, bottom);
        gradient.setColorAt(0.0, top);
        gradient.setColorAt(1.0, low);
        painter.setPen(Qt::NoPen);
        painter.setBrush(gradient);
        painter.drawPolygon(area);
        painter.setBrush(Qt::NoBrush);
    }

    if (series.kind() == SeriesKind::Baseline) {
        const QColor above = options.topLineColor.isValid() ? options.topLineColor : options.upColor;
        const QColor below = options.bottomLineColor.isValid() ? options.bottomLineColor : options.downColor;
        for (int i = 1; i < line.size(); ++i) {
            const double mid = (values[i - 1] + values[i]) / 2.0;
            painter.setPen(seriesPen(mid >= options.baseValue ? above : below, options.lineWidth, options.lineStyle));
            painter.drawLine(line[i - 1], line[i]);
        }
        if (auto base = priceToY(scale, options.baseValue)) {
            painter.setPen(QPen(m_config.gridColor, 1, Qt::DotLine));
            painter.drawLine(QPointF(0, *base), QPointF(plotRect().width(), *base));
        }
        return;
    }

    painter.setPen(seriesPen(options.color, options.lineWidth, options.lineStyle));
    if (line.size() == 1) {
        painter.drawPoint(line.first());
    } else {
        painter.drawPolyline(line);
    }
}

void ChartSurface::paintHistogram(QPainter& painter, const Series& series, const PriceScale& scale) const {
    auto [first, last] = visibleIndexSpan();
    if (first > last) return;
    const auto& data = series.data();
    const auto& options = series.options();

    auto baseY = priceToY(scale, 0.0);
    if (!baseY) return;
    const double base = std::min(*baseY, plotRect().height());
    const double width = std::max(1.0, m_barSpacing * 0.8);

    auto it = std::lower_bound(data.begin(), data.end(), m_timeIndex[first],
                               [](const SeriesPoint& p, UnixTime t) { return p.time < t; });
    painter.setPen(Qt::NoPen);
    for (; it != data.end() && it->time <= m_timeIndex[last]; ++it) {
        auto x = timeToCoordinate(it->time);
        auto y = priceToY(scale, it->value);
        if (!x || !y) continue;
        const QColor color = ColorParser::parseOr(it->color, options.color);
        painter.fillRect(QRectF(*x - width / 2.0, std::min(*y, base), width, std::abs(base - *y)), color);
    }
}

void ChartSurface::paintBars(QPainter& painter, const Series& series, const PriceScale& scale) const {
    auto [first, last] = visibleIndexSpan();
    if (first > last) return;
    const auto& data = series.data();
    const auto& options = series.options();
    const double bodyWidth = std::max(1.0, m_barSpacing * 0.7);

    auto it = std::lower_bound(data.begin(), data.end(), m_timeIndex[first],
                               [](const SeriesPoint& p, UnixTime t) { return p.time < t; });
    for (; it != data.end() && it->time <= m_timeIndex[last]; ++it) {
        if (!it->ohlc) continue;
        auto x = timeToCoordinate(it->time);
        auto yOpen = priceToY(scale, it->ohlc->open);
        auto yHigh = priceToY(scale, it->ohlc->high);
        auto yLow = priceToY(scale, it->ohlc->low);
        auto yClose = priceToY(scale, it->ohlc->close);
        if (!x || !yOpen || !yHigh || !yLow || !yClose) continue;

        const QColor color = it->ohlc->close >= it->ohlc->open ? options.upColor : options.downColor;
        painter.setPen(QPen(color, 1));
        painter.drawLine(QPointF(*x, *yHigh), QPointF(*x, *yLow));

        if (series.kind() == SeriesKind::Candlestick) {
            const double top = std::min(*yOpen, *yClose);
            const double height = std::max(1.0, std::abs(*yOpen - *yClose));
            painter.fillRect(QRectF(*x - bodyWidth / 2.0, top, bodyWidth, height), color);
        } else {
            painter.drawLine(QPointF(*x - bodyWidth / 2.0, *yOpen), QPointF(*x, *yOpen));
            painter.drawLine(QPointF(*x, *yClose), QPointF(*x + bodyWidth / 2.0, *yClose));
        }
    }
}

void ChartSurface::paintPrimitives(QPainter& painter, double pixelRatio) {
    if (m_primitives.empty() || pixelRatio <= 0.0) return;
    const QRectF plot = plotRect();

    // Renderers draw in bitmap space
    painter.save();
    painter.scale(1.0 / pixelRatio, 1.0 / pixelRatio);
    BitmapScope scope{&painter, pixelRatio, pixelRatio,
                      QSize(qRound(plot.width() * pixelRatio), qRound(plot.height() * pixelRatio))};
    const auto primitives = m_primitives;
    for (auto* primitive : primitives) {
        for (auto* view : primitive->paneViews()) {
            if (auto* renderer = view ? view->renderer() : nullptr) {
                renderer->draw(scope);
            }
        }
    }
    painter.restore();
}

void ChartSurface::paintMarkers(QPainter& painter) const {
    for (const auto* layer : m_markerLayers) {
        if (!layer->m_series || layer->m_markers.empty()) continue;
        const PriceScale* scale = scaleFor(scaleIdOf(layer->m_series->options()));
        if (!scale) continue;
        const auto& bars = layer->m_series->data();

        for (const auto& marker : layer->m_markers) {
            auto x = timeToCoordinate(marker.time);
            auto index = BarLookup::nearestBarIndex(bars, marker.time);
            if (!x || !index || bars[*index].time != marker.time) continue;

            const SeriesPoint& bar = bars[*index];
            double price = bar.value;
            if (bar.ohlc && marker.position == MarkerPosition::AboveBar) price = bar.ohlc->high;
            if (bar.ohlc && marker.position == MarkerPosition::BelowBar) price = bar.ohlc->low;
            auto y = priceToY(*scale, price);
            if (!y) continue;

            const double radius = std::clamp(m_barSpacing * 0.5, 2.5, 6.0) * std::max(0.5, marker.size);
            double cy = *y;
            if (marker.position == MarkerPosition::AboveBar) cy -= radius + 4.0;
            if (marker.position == MarkerPosition::BelowBar) cy += radius + 4.0;
            const QPointF c(*x, cy);

            painter.setPen(Qt::NoPen);
            painter.setBrush(marker.color);
            switch (marker.shape) {
                case MarkerShape::Circle:
                    painter.drawEllipse(c, radius, radius);
                    break;
                case MarkerShape::Square:
                    painter.drawRect(QRectF(c.x() - radius, c.y() - radius, radius * 2, radius * 2));
                    break;
                case MarkerShape::ArrowUp:
                    painter.drawPolygon(QPolygonF({QPointF(c.x(), c.y() - radius),
                                                   QPointF(c.x() - radius, c.y() + radius),
                                                   QPointF(c.x() + radius, c.y() + radius)}));
                    break;
                case MarkerShape::ArrowDown:
                    painter.drawPolygon(QPolygonF({QPointF(c.x(), c.y() + radius),
                                                   QPointF(c.x() - radius, c.y() - radius),
                                                   QPointF(c.x() + radius, c.y() - radius)}));
                    break;
            }
            painter.setBrush(Qt::NoBrush);

            if (!marker.text.isEmpty()) {
                painter.setPen(marker.color);
                const double ty = marker.position == MarkerPosition::AboveBar ? c.y() - radius - 12.0
                                                                              : c.y() + radius + 2.0;
                painter.drawText(QRectF(c.x() - 40.0, ty, 80.0, 12.0), Qt::AlignCenter, marker.text);
            }
        }
    }
}

void ChartSurface::paintAxes(QPainter& painter) const {
    const QRectF plot = plotRect();
    painter.save();
    painter.setPen(QPen(m_config.gridColor, 1));
    painter.drawLine(QPointF(plot.right(), 0), QPointF(plot.right(), plot.bottom()));
    painter.drawLine(QPointF(0, plot.bottom()), QPointF(plot.right(), plot.bottom()));

    QFont font = painter.font();
    font.setPixelSize(11);
    painter.setFont(font);

    // Price labels
    if (const PriceScale* scale = m_main ? scaleFor(scaleIdOf(m_main->options())) : nullptr) {
        const double step = niceStep(scale->maxValue - scale->minValue, 6);
        const int decimals = priceDecimals(step);
        painter.setPen(m_config.textColor);
        for (double v = std::ceil(scale->minValue / step) * step; v <= scale->maxValue; v += step) {
            auto y = priceToY(*scale, v);
            if (!y || *y < 6.0 || *y > plot.bottom() - 6.0) continue;
            painter.drawText(QRectF(plot.right() + 4.0, *y - 7.0, m_config.priceAxisWidth - 6.0, 14.0),
                             Qt::AlignLeft | Qt::AlignVCenter, QString::number(v, 'f', decimals));
        }

        // Last value badges
        for (const auto& series : m_series) {
            const auto& options = series->options();
            if (!options.lastValueVisible || series->data().empty()) continue;
            if (scaleIdOf(options) != scaleIdOf(m_main->options())) continue;
            const SeriesPoint& lastPoint = series->data().back();
            auto y = priceToY(*scale, lastPoint.value);
            if (!y) continue;
            QColor badge = options.color;
            if (lastPoint.ohlc) {
                badge = lastPoint.ohlc->close >= lastPoint.ohlc->open ? options.upColor : options.downColor;
            }
            const QRectF box(plot.right() + 1.0, *y - 8.0, m_config.priceAxisWidth - 2.0, 16.0);
            painter.fillRect(box, badge);
            painter.setPen(Qt::white);
            painter.drawText(box.adjusted(3, 0, 0, 0), Qt::AlignLeft | Qt::AlignVCenter,
                             QString::number(lastPoint.value, 'f', decimals));
        }
    }

    // Time labels every ~90px
    auto [first, last] = visibleIndexSpan();
    if (first <= last && m_barSpacing > 0.0) {
        const int every = std::max(1, static_cast<int>(std::ceil(90.0 / m_barSpacing)));
        painter.setPen(m_config.textColor);
        for (int i = first - (first % every); i <= last; i += every) {
            if (i < 0) continue;
            auto x = logicalToCoordinate(static_cast<double>(i));
            if (!x || *x < 0.0 || *x > plot.right()) continue;
            const QString label = QDateTime::fromSecsSinceEpoch(m_timeIndex[i], QTimeZone::utc()).toString("MM-dd hh:mm");
            painter.drawText(QRectF(*x - 45.0, plot.bottom() + 3.0, 90.0, m_config.timeAxisHeight - 4.0),
                             Qt::AlignCenter, label);
        }
    }
    painter.restore();
}

} // namespace vantage
