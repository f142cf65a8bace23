/*
Vantage — SeriesOverlayRegistry
Role: Id-keyed registry of every overlay drawn over the main candle series: host series for
  indicators and strategies, marker sets, shape primitives and fill regions.
Inputs/Outputs: Producer JSON (point arrays, API responses, shape arrays) and typed descriptors in;
  host series, attached primitives and marker layer updates out. Every public operation reports
  success as bool (or a count / ApiIngestResult) and never throws.
Threading: GUI thread only. No locking; the realtime router calls in on the same thread.
Performance: Multi-series fan-out is one synchronous pass. Shape kinds become one primitive each,
  so a thousand lines cost one attach and one stroke path per style.
Integration: Owned by OverlayChartItem next to the ChartSurface it draws on. The router resolves
  indicator ticks through seriesHandle().
Observability: vLog_App for CRUD, vLog_Data for ingest details, vLog_Warning for rejected input.
Related: SeriesOverlayRegistry.cpp, MarkerAggregator.hpp, AttachScheduler.hpp,
  ShapePrimitiveFactory.hpp, SeriesTransform.hpp, ShapeParser.hpp.
Assumptions: The host outlives the registry. Primitives read the main series' own data, so candle
  ticks reach them without re-registration.
*/
#pragma once
#include "AttachScheduler.hpp"
#include "MarkerAggregator.hpp"
#include "OverlayDefaults.hpp"
#include "../host/ChartHost.hpp"
#include "../render/ShapePrimitiveFactory.hpp"

#include <QObject>
#include <map>
#include <memory>
#include "../../core/VantageJson.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vantage {

// Outcome of addFromApiResponse / addShapesFromApiResponse, one flag per ingested section
struct ApiIngestResult {
    bool seriesAdded = false;
    bool markers = false;
    bool lines = false;
    bool boxes = false;
    bool arrows = false;
    bool markerShapes = false;
    int fills = 0;

    bool anyShapes() const { return markers || lines || boxes || arrows || markerShapes || fills > 0; }
};

class SeriesOverlayRegistry : public QObject {
    Q_OBJECT

public:
    explicit SeriesOverlayRegistry(IChartHost* host, AttachSchedulerConfig schedulerConfig = {},
                                   QObject* parent = nullptr);
    ~SeriesOverlayRegistry() override;

    SeriesOverlayRegistry(const SeriesOverlayRegistry&) = delete;
    SeriesOverlayRegistry& operator=(const SeriesOverlayRegistry&) = delete;

    // The candle series shapes and markers attach to. Switching to another series drops the
    // primitives built against the old one; marker sets move to the new series' layer.
    void setMainSeries(ISeriesApi* series);
    ISeriesApi* mainSeries() const { return m_main; }
    IChartHost* host() const { return m_host; }

    // =========================================================================
    // SERIES
    // =========================================================================

    bool addSeries(const std::string& id, const Json& points,
                   const SeriesDescriptor& descriptor = {},
                   const Json& params = Json::object());
    bool updateSeries(const std::string& id, const Json& points);
    bool removeSeries(const std::string& id);
    int removeSeriesByPrefix(const std::string& prefix);
    void clearAll();

    bool hasSeries(const std::string& id) const { return m_entries.count(id) > 0; }
    std::vector<std::string> getAllSeriesIds() const;
    ISeriesApi* seriesHandle(const std::string& id) const;
    std::optional<SeriesKind> seriesKind(const std::string& id) const;

    ApiIngestResult addFromApiResponse(const std::string& id, const Json& response,
                                       const Json& extraParams = Json::object());

    // strategy_<name>_signals | _trend | _levels | _<custom>
    int addStrategySeries(const std::string& strategyName, const Json& seriesData,
                          const Json& configs = Json::object());
    int removeStrategy(const std::string& strategyName);

    // =========================================================================
    // SHAPES
    // =========================================================================

    bool addShapes(const std::vector<ShapeDescriptor>& shapes);

    bool addBoxes(const std::vector<BoxShape>& boxes);
    void removeAllBoxes();
    bool updateBoxes(const std::vector<BoxShape>& boxes);

    bool addLines(const std::vector<LineShape>& lines);
    void removeAllLines();
    bool updateLines(const std::vector<LineShape>& lines);

    bool addArrows(const std::vector<ArrowShape>& arrows);
    void removeAllArrows();
    bool updateArrows(const std::vector<ArrowShape>& arrows);

    bool addMarkerShapes(const std::vector<MarkerGlyphShape>& glyphs);
    void removeAllMarkerShapes();
    bool updateMarkerShapes(const std::vector<MarkerGlyphShape>& glyphs);

    // An existing fill with the same id is replaced
    bool addFillBetween(const std::string& id, const FillRegion& region, ConditionalColor conditionalColor = {});
    bool removeFillBetween(const std::string& id);
    bool updateFillBetween(const std::string& id, const FillRegion& region);
    bool updateFillSources(const std::string& id, FillSource source1, FillSource source2);
    void removeAllFillBetween();
    bool hasFill(const std::string& id) const { return m_fills.count(id) > 0; }
    std::vector<std::string> fillIds() const;

    bool addShapeMarkers(const std::string& id, const std::vector<MarkerSpec>& markers);
    bool removeShapeMarkers(const std::string& id);
    void removeAllShapeMarkers();

    // {markers, lines, boxes, arrows, markerShapes, fill, fills}; fill sources named by series key
    // resolve against seriesMap
    ApiIngestResult addShapesFromApiResponse(const std::string& id, const Json& shapes,
                                             const Json& seriesMap = Json::object());
    void removeShapes(const std::string& id);
    void clearAllShapes();

    size_t primitiveCount(ShapeKind kind) const;
    size_t attachedPrimitiveCount() const;
    const MarkerAggregator& markers() const { return m_markers; }
    AttachScheduler* scheduler() const { return m_scheduler; }

signals:
    void overlaysChanged();

private:
    struct OverlayEntry {
        SeriesKind kind = SeriesKind::Line;
        ISeriesApi* series = nullptr;      // null for marker-kind entries
        SeriesDescriptor descriptor;
        Json params;
        std::string color;
    };

    struct PrimitiveSlot {
        quint64 serial = 0;
        std::unique_ptr<IPanePrimitive> primitive;
        bool attached = false;
    };

    struct ShapeSlot {
        ShapeKind kind;
        PrimitiveSlot slot;
    };

    struct FillSlot {
        PrimitiveSlot slot;
        FillBetweenPrimitive* fill = nullptr;  // view of slot.primitive
    };

    // Folds every overlaysChanged inside its scope into one emission when the outermost batch ends
    class ChangeBatch {
    public:
        explicit ChangeBatch(SeriesOverlayRegistry& registry);
        ~ChangeBatch();
        ChangeBatch(const ChangeBatch&) = delete;
        ChangeBatch& operator=(const ChangeBatch&) = delete;

    private:
        SeriesOverlayRegistry& m_registry;
    };

    bool addMarkerSeries(const std::string& id, const Json& points,
                         const SeriesDescriptor& descriptor, const Json& params);
    SeriesOptions buildOptions(const std::string& id, const SeriesDescriptor& descriptor,
                               const std::string& color, int lineWidth) const;

    bool requireMainSeries(const char* operation) const;
    quint64 adopt(PrimitiveSlot& slot, std::unique_ptr<IPanePrimitive> primitive);
    void attachSlot(quint64 serial);
    void release(PrimitiveSlot& slot);
    void removePrimitives(ShapeKind kind);
    void notifyChanged();

    IChartHost* m_host;
    ISeriesApi* m_main = nullptr;
    AttachScheduler* m_scheduler;
    MarkerAggregator m_markers;

    std::map<std::string, OverlayEntry> m_entries;
    std::vector<ShapeSlot> m_shapes;
    std::map<std::string, FillSlot> m_fills;
    quint64 m_nextSerial = 1;
    int m_batchDepth = 0;
    bool m_changedInBatch = false;
};

} // namespace vantage
