#include "OverlayChartItem.hpp"
#include "../core/VantageLogging.hpp"
#include "../core/realtime/BeastWsTransport.hpp"
#include "../core/series/SeriesTransform.hpp"

#include <QMouseEvent>
#include <QPainter>
#include <QQuickWindow>
#include <QWheelEvent>
#include <algorithm>

namespace vantage {

OverlayChartItem::OverlayChartItem(QQuickItem* parent)
    : QQuickPaintedItem(parent)
    , m_registry(std::make_unique<SeriesOverlayRegistry>(&m_surface))
{
    setAcceptedMouseButtons(Qt::LeftButton);
    setAntialiasing(true);
    setOpaquePainting(true);

    m_surface.setRepaintCallback([this]() { update(); });
    m_registry->setMainSeries(m_surface.createMainSeries());
    connect(m_registry.get(), &SeriesOverlayRegistry::overlaysChanged, this, &OverlayChartItem::overlaysChanged);

    createRouter([]() -> std::unique_ptr<WsTransport> { return std::make_unique<BeastWsTransport>(); });
    vLog_App("OverlayChartItem created");
}

OverlayChartItem::~OverlayChartItem() {
    // Router first: its transport must stop before the registry goes away
    m_router.reset();
    m_registry.reset();
    m_surface.setRepaintCallback({});
}

void OverlayChartItem::createRouter(RealtimeUpdateRouter::TransportFactory factory) {
    m_router = std::make_unique<RealtimeUpdateRouter>(*m_registry, std::move(factory), RouterConfig::fromEnvironment());
    connect(m_router.get(), &RealtimeUpdateRouter::stateChanged, this,
            [this](ConnectionState, const QString&) { emit connectionStatusChanged(); });
}

void OverlayChartItem::setTransportFactory(RealtimeUpdateRouter::TransportFactory factory) {
    const ChartContext context = m_router ? m_router->context() : ChartContext{};
    createRouter(std::move(factory));
    if (context.valid()) m_router->setContext(context);
    emit connectionStatusChanged();
}

void OverlayChartItem::paint(QPainter* painter) {
    const double ratio = window() ? window()->effectiveDevicePixelRatio() : 1.0;
    m_surface.paint(*painter, ratio);
}

// =============================================================================
// DATA
// =============================================================================

bool OverlayChartItem::loadCandles(const QString& json) {
    Json parsed;
    try {
        parsed = Json::parse(json.toStdString());
    } catch (const Json::exception& e) {
        vLog_Warning("Candle payload is not JSON:" << e.what());
        return false;
    }

    std::vector<SeriesPoint> candles = SeriesTransform::apply(parsed, "main", SeriesKind::Candlestick);
    if (candles.empty()) {
        vLog_Warning("Candle payload has no valid bars");
        return false;
    }
    return m_router->replaceCandles(std::move(candles));
}

bool OverlayChartItem::addIndicator(const QString& id, const QString& json) {
    Json parsed;
    try {
        parsed = Json::parse(json.toStdString());
    } catch (const Json::exception& e) {
        vLog_Warning("Indicator payload for" << id << "is not JSON:" << e.what());
        return false;
    }
    const ApiIngestResult result = m_registry->addFromApiResponse(id.toStdString(), parsed);
    return result.seriesAdded || result.anyShapes();
}

bool OverlayChartItem::removeIndicator(const QString& id) {
    const std::string key = id.toStdString();
    int removed = m_registry->removeSeries(key) ? 1 : 0;
    removed += m_registry->removeSeriesByPrefix(key + "_");
    m_registry->removeShapes(key);
    return removed > 0;
}

void OverlayChartItem::clearShapes() {
    m_registry->clearAllShapes();
}

// =============================================================================
// CONNECTION
// =============================================================================

void OverlayChartItem::setContext(const QString& provider, const QString& symbol, const QString& interval) {
    m_router->setContext(ChartContext{provider.toStdString(), symbol.toStdString(), interval.toStdString()});
}

void OverlayChartItem::reconnect() {
    m_router->reconnect();
}

QString OverlayChartItem::connectionStatus() const {
    return m_router ? m_router->statusMessage() : QString();
}

QString OverlayChartItem::connectionState() const {
    return m_router ? QString::fromLatin1(toString(m_router->state())) : QString();
}

int OverlayChartItem::overlayCount() const {
    return m_registry ? static_cast<int>(m_registry->getAllSeriesIds().size()) : 0;
}

// =============================================================================
// VIEWPORT
// =============================================================================

void OverlayChartItem::resetZoom() {
    m_surface.applyDefaultZoom();
    m_surface.requestRepaint();
}

void OverlayChartItem::geometryChange(const QRectF& newGeometry, const QRectF& oldGeometry) {
    QQuickPaintedItem::geometryChange(newGeometry, oldGeometry);
    if (newGeometry.size() != oldGeometry.size()) {
        vLog_Render("Chart item resized to" << newGeometry.size());
        m_surface.setViewportSize(newGeometry.size());
    }
}

void OverlayChartItem::mousePressEvent(QMouseEvent* event) {
    if (isVisible() && event->button() == Qt::LeftButton) {
        m_dragging = true;
        m_lastDragPos = event->position();
        event->accept();
    } else {
        event->ignore();
    }
}

void OverlayChartItem::mouseMoveEvent(QMouseEvent* event) {
    if (!m_dragging) {
        event->ignore();
        return;
    }
    const double dx = event->position().x() - m_lastDragPos.x();
    m_lastDragPos = event->position();
    if (m_surface.barSpacing() > 0.0 && dx != 0.0) {
        // Dragging right reveals older bars
        m_surface.scrollBy(-dx / m_surface.barSpacing());
    }
    event->accept();
}

void OverlayChartItem::mouseReleaseEvent(QMouseEvent* event) {
    if (m_dragging && event->button() == Qt::LeftButton) {
        m_dragging = false;
        event->accept();
    } else {
        event->ignore();
    }
}

void OverlayChartItem::wheelEvent(QWheelEvent* event) {
    if (!isVisible() || !m_surface.isReady()) {
        event->ignore();
        return;
    }
    const double delta = std::clamp(event->angleDelta().y() * ZOOM_SENSITIVITY, -MAX_ZOOM_DELTA, MAX_ZOOM_DELTA);
    m_surface.zoomBy(1.0 + delta, event->position().x());
    event->accept();
}

} // namespace vantage
