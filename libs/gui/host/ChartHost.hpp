/*
Vantage — ChartHost
Role: The seam between the overlay engine and whatever chart draws the candles. Everything the
  registry, primitives and router need from a chart is expressed here.
Inputs/Outputs: Series handles (setData / update / data), coordinate conversion, primitive
  attachment, one marker layer per series, readiness notification.
Threading: GUI thread only.
Performance: Coordinate conversions are called per shape per frame; implementations keep them O(log n).
Integration: ChartSurface is the in-process implementation; tests use a fake host.
Observability: None at the interface level.
Related: ChartSurface.hpp, SeriesOverlayRegistry.hpp, render/primitives/*.
Assumptions: Coordinates are media pixels (device independent) with the origin at the top-left
  of the plot area. Renderers convert to bitmap space through BitmapScope.
*/
#pragma once
#include "../../core/model/OverlayTypes.hpp"
#include "../../core/series/BarLookup.hpp"

#include <QColor>
#include <QSize>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class QPainter;

namespace vantage {

// =============================================================================
// PRIMITIVE CONTRACT
// =============================================================================

// Bitmap-space drawing target handed to every renderer on repaint
struct BitmapScope {
    QPainter* painter = nullptr;
    double horizontalPixelRatio = 1.0;
    double verticalPixelRatio = 1.0;
    QSize bitmapSize;
};

class IPaneRenderer {
public:
    virtual ~IPaneRenderer() = default;
    virtual void draw(BitmapScope& scope) = 0;
};

class IPaneView {
public:
    virtual ~IPaneView() = default;
    virtual IPaneRenderer* renderer() = 0;
};

struct AutoscaleInfo {
    double minValue = 0.0;
    double maxValue = 0.0;
};

class IPanePrimitive {
public:
    virtual ~IPanePrimitive() = default;

    // Recompute pixel geometry for the current pan/zoom
    virtual void updateAllViews() = 0;
    virtual std::vector<IPaneView*> paneViews() = 0;
    virtual std::optional<AutoscaleInfo> autoscaleInfo() const = 0;
};

// =============================================================================
// MARKERS
// =============================================================================

enum class MarkerShape { Circle, Square, ArrowUp, ArrowDown };
enum class MarkerPosition { AboveBar, BelowBar, InBar };

struct HostMarker {
    UnixTime time = 0;
    MarkerPosition position = MarkerPosition::InBar;
    QColor color;
    MarkerShape shape = MarkerShape::Circle;
    QString text;
    double size = 1.0;
};

// One full marker array per call; the previous array is replaced
class IMarkerLayer {
public:
    virtual ~IMarkerLayer() = default;
    virtual void setMarkers(std::vector<HostMarker> markers) = 0;
};

// =============================================================================
// SERIES
// =============================================================================

struct SeriesOptions {
    QColor color = QColor(0x29, 0x62, 0xFF);
    int lineWidth = 2;
    LineStyle lineStyle = LineStyle::Solid;
    QString title;
    bool priceLineVisible = true;
    bool lastValueVisible = true;
    QString priceScaleId = QStringLiteral("right");
    double scaleMarginTop = 0.1;
    double scaleMarginBottom = 0.1;

    // Area
    QColor topColor;
    QColor bottomColor;

    // Baseline
    double baseValue = 0.0;
    QColor topLineColor;
    QColor bottomLineColor;

    // Candlestick / bar
    QColor upColor = QColor(0x26, 0xa6, 0x9a);
    QColor downColor = QColor(0xef, 0x53, 0x50);
};

class ISeriesApi {
public:
    virtual ~ISeriesApi() = default;

    virtual SeriesKind kind() const = 0;
    virtual void setData(std::vector<SeriesPoint> points) = 0;

    // Append when newer than the last point, replace when equal; older points are rejected
    virtual bool update(const SeriesPoint& point) = 0;

    virtual const std::vector<SeriesPoint>& data() const = 0;
    virtual const SeriesOptions& options() const = 0;
    virtual void applyOptions(const SeriesOptions& options) = 0;
};

// =============================================================================
// HOST
// =============================================================================

class IChartHost {
public:
    virtual ~IChartHost() = default;

    virtual ISeriesApi* addSeries(SeriesKind kind, const SeriesOptions& options) = 0;
    virtual void removeSeries(ISeriesApi* series) = 0;

    virtual std::optional<double> timeToCoordinate(UnixTime time) const = 0;
    virtual std::optional<double> logicalToCoordinate(double logical) const = 0;
    virtual std::optional<LogicalRange> visibleLogicalRange() const = 0;
    virtual std::optional<double> priceToCoordinate(double price) const = 0;

    // The host does not own attached primitives; detach before destroying one
    virtual void attachPrimitive(IPanePrimitive* primitive) = 0;
    virtual void detachPrimitive(IPanePrimitive* primitive) = 0;

    virtual std::unique_ptr<IMarkerLayer> createMarkerLayer(ISeriesApi* series) = 0;

    virtual bool isReady() const = 0;
    virtual void onReady(std::function<void()> callback) = 0;
    virtual void requestRepaint() = 0;
};

} // namespace vantage
