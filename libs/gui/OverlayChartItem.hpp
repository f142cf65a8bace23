/*
Vantage — OverlayChartItem
Role: QML item hosting a ChartSurface together with the overlay registry and realtime router
  that draw on it.
Inputs/Outputs: Candle and indicator JSON through Q_INVOKABLEs, mouse drag / wheel for pan and
  zoom; paints the surface through QPainter.
Threading: GUI thread. Painting happens on the scene graph's texture upload, driven by update().
Performance: The surface only walks the visible logical range; primitives re-derive geometry
  once per paint.
Integration: Registered as Vantage.Charts/OverlayChart by vantage_viewer. C++ callers reach the
  registry and router through the accessors.
Observability: vLog_App for lifecycle, vLog_Render for viewport changes.
Related: OverlayChartItem.cpp, ChartSurface.hpp, SeriesOverlayRegistry.hpp, RealtimeUpdateRouter.hpp.
Assumptions: Member order is load-bearing: the surface is declared first so the registry and
  router (which hold pointers into it) are destroyed before it.
*/
#pragma once
#include "host/ChartSurface.hpp"
#include "overlay/SeriesOverlayRegistry.hpp"
#include "realtime/RealtimeUpdateRouter.hpp"

#include <QPointF>
#include <QQuickPaintedItem>
#include <QString>
#include <memory>

class QMouseEvent;
class QWheelEvent;

namespace vantage {

class OverlayChartItem : public QQuickPaintedItem {
    Q_OBJECT
    Q_PROPERTY(QString connectionStatus READ connectionStatus NOTIFY connectionStatusChanged)
    Q_PROPERTY(QString connectionState READ connectionState NOTIFY connectionStatusChanged)
    Q_PROPERTY(int overlayCount READ overlayCount NOTIFY overlaysChanged)

public:
    explicit OverlayChartItem(QQuickItem* parent = nullptr);
    ~OverlayChartItem() override;

    void paint(QPainter* painter) override;

    // Candles as a JSON array of {time, open, high, low, close}
    Q_INVOKABLE bool loadCandles(const QString& json);
    // An indicator API response {metadata, series, shapes?}
    Q_INVOKABLE bool addIndicator(const QString& id, const QString& json);
    Q_INVOKABLE bool removeIndicator(const QString& id);
    Q_INVOKABLE void clearShapes();

    Q_INVOKABLE void setContext(const QString& provider, const QString& symbol, const QString& interval);
    Q_INVOKABLE void reconnect();
    Q_INVOKABLE void resetZoom();

    QString connectionStatus() const;
    QString connectionState() const;
    int overlayCount() const;

    ChartSurface& surface() { return m_surface; }
    SeriesOverlayRegistry& registry() { return *m_registry; }
    RealtimeUpdateRouter& router() { return *m_router; }

    // Replaces the transport factory (tests, alternative channels); reconnects if a context is set
    void setTransportFactory(RealtimeUpdateRouter::TransportFactory factory);

signals:
    void connectionStatusChanged();
    void overlaysChanged();

protected:
    void geometryChange(const QRectF& newGeometry, const QRectF& oldGeometry) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void createRouter(RealtimeUpdateRouter::TransportFactory factory);

    // Same feel as the grid view's wheel handling
    static constexpr double ZOOM_SENSITIVITY = 0.0005;
    static constexpr double MAX_ZOOM_DELTA = 0.4;

    ChartSurface m_surface;
    std::unique_ptr<SeriesOverlayRegistry> m_registry;
    std::unique_ptr<RealtimeUpdateRouter> m_router;

    bool m_dragging = false;
    QPointF m_lastDragPos;
};

} // namespace vantage
