/*
Vantage — ChartSurface
Role: In-process IChartHost: a candlestick chart with overlay series, a bar-spacing time scale,
  autoscaled price scales, attached primitives and native marker layers.
Inputs/Outputs: Series data through ISeriesApi handles, pan/zoom through scrollBy/zoomBy;
  paints everything into a QPainter on request.
Threading: GUI thread only. Not a QObject; the owning item forwards repaint requests.
Performance: Time lookups are binary searches over the merged time index. Only the visible
  logical range (plus one bar either side) is walked when painting or autoscaling.
Integration: Owned by OverlayChartItem; the registry, primitives and router see it as IChartHost.
Observability: vLog_Render for layout changes, vLog_Warning for rejected data.
Related: ChartSurface.cpp, ChartHost.hpp, ChartSurfaceConfig.hpp, OverlayChartItem.hpp.
Assumptions: The first candlestick series created through createMainSeries() drives readiness
  and the default zoom. Logical index i is the i-th distinct time across all series.
*/
#pragma once
#include "ChartHost.hpp"
#include "ChartSurfaceConfig.hpp"

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

class QPainter;

namespace vantage {

class ChartSurface : public IChartHost {
public:
    explicit ChartSurface(ChartSurfaceConfig config = {});
    ~ChartSurface() override;

    ChartSurface(const ChartSurface&) = delete;
    ChartSurface& operator=(const ChartSurface&) = delete;

    // IChartHost
    ISeriesApi* addSeries(SeriesKind kind, const SeriesOptions& options) override;
    void removeSeries(ISeriesApi* series) override;
    std::optional<double> timeToCoordinate(UnixTime time) const override;
    std::optional<double> logicalToCoordinate(double logical) const override;
    std::optional<LogicalRange> visibleLogicalRange() const override;
    std::optional<double> priceToCoordinate(double price) const override;
    void attachPrimitive(IPanePrimitive* primitive) override;
    void detachPrimitive(IPanePrimitive* primitive) override;
    std::unique_ptr<IMarkerLayer> createMarkerLayer(ISeriesApi* series) override;
    bool isReady() const override;
    void onReady(std::function<void()> callback) override;
    void requestRepaint() override;

    // Main candle series: the time scale anchor every overlay is drawn against
    ISeriesApi* createMainSeries(const SeriesOptions& options = {});
    ISeriesApi* mainSeries() const;

    // Viewport
    void setViewportSize(const QSizeF& size);
    QRectF plotRect() const;
    void scrollBy(double bars);
    void zoomBy(double factor, double anchorX);
    void applyDefaultZoom();
    std::optional<double> coordinateToLogical(double x) const;
    double barSpacing() const { return m_barSpacing; }
    const std::vector<UnixTime>& timeIndex() const { return m_timeIndex; }

    // Price of a series' own scale (separate-pane histograms have their own)
    std::optional<double> priceToCoordinate(const ISeriesApi* series, double price) const;

    void paint(QPainter& painter, double pixelRatio);
    void setRepaintCallback(std::function<void()> callback) { m_repaintCallback = std::move(callback); }

    size_t seriesCount() const { return m_series.size(); }
    size_t primitiveCount() const { return m_primitives.size(); }
    const ChartSurfaceConfig& config() const { return m_config; }

private:
    class Series;
    class NativeMarkerLayer;

    struct PriceScale {
        double minValue = 0.0;
        double maxValue = 0.0;
        double marginTop = 0.1;
        double marginBottom = 0.1;
        bool valid = false;
    };

    ChartSurfaceConfig m_config;

    std::vector<std::unique_ptr<Series>> m_series;
    Series* m_main = nullptr;
    std::vector<IPanePrimitive*> m_primitives;
    std::vector<NativeMarkerLayer*> m_markerLayers;

    // Time scale
    std::vector<UnixTime> m_timeIndex;
    double m_barSpacing;
    double m_rightEdge = 0.0;   // x(l) = plotWidth - (m_rightEdge - l + 0.5) * m_barSpacing
    bool m_defaultZoomApplied = false;
    QSizeF m_viewportSize;

    // Price scales, rebuilt lazily for the visible range
    mutable std::map<QString, PriceScale> m_scales;
    mutable bool m_scalesDirty = true;

    // Readiness
    std::vector<std::function<void()>> m_readyCallbacks;
    bool m_readyNotified = false;
    std::function<void()> m_repaintCallback;

    // Called by Series
    void onSeriesDataChanged();
    void onSeriesPointUpdated(UnixTime time);

    void rebuildTimeIndex();
    void checkReady();
    std::optional<int> indexOfTime(UnixTime time) const;
    std::pair<int, int> visibleIndexSpan() const;

    void rebuildScales() const;
    const PriceScale* scaleFor(const QString& scaleId) const;
    std::optional<double> priceToY(const PriceScale& scale, double price) const;

    // Painting
    void paintSeries(QPainter& painter, const Series& series) const;
    void paintLineLike(QPainter& painter, const Series& series, const PriceScale& scale) const;
    void paintHistogram(QPainter& painter, const Series& series, const PriceScale& scale) const;
    void paintBars(QPainter& painter, const Series& series, const PriceScale& scale) const;
    void paintPrimitives(QPainter& painter, double pixelRatio);
    void paintMarkers(QPainter& painter) const;
    void paintAxes(QPainter& painter) const;
};

} // namespace vantage
