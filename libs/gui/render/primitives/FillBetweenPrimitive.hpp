/*
Vantage — FillBetweenPrimitive
Role: Shades the region between two sources: two horizontal levels (bands), or two series
  such as close vs. an indicator line (clouds).
Inputs/Outputs: FillRegion (sources, colour mode, palette); per-frame quads or one band rect.
Threading: GUI thread.
Performance: Only visible steps (one step of padding either side) are evaluated. External
  series are looked up through a hash map built once per updateSourceData().
Integration: Created by ShapePrimitiveFactory::createFill, owned by SeriesOverlayRegistry.
Observability: vLog_Render with per-frame quad and gap counts.
Related: FillBetweenPrimitive.cpp, OverlayTypes.hpp (FillRegion), ShapeParser::parseFillRegion.
Assumptions: Steps follow the backing candle data. hline mode requires two constant levels.
*/
#pragma once
#include "PrimitivePaneView.hpp"
#include "../ShapeCoordinateResolver.hpp"

#include <QColor>
#include <QPolygonF>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace vantage {

// One step handed to a conditional colour callback
struct FillStep {
    int index = 0;              // bar index in the backing data
    UnixTime time = 0;
    double value1 = 0.0;
    double value2 = 0.0;
};

using ConditionalColor = std::function<std::optional<QColor>(const FillStep&)>;

struct FillQuad {
    QPolygonF polygon;          // media px: s1(t0), s1(t1), s2(t1), s2(t0)
    QColor color;
    bool gradient = false;
    QColor topColor;
    QColor bottomColor;
};

struct FillBand {
    double top = 0.0;           // media px, top <= bottom
    double bottom = 0.0;
    QColor color;
    bool gradient = false;
    QColor topColor;
    QColor bottomColor;
};

struct FillGeometry {
    std::vector<FillQuad> quads;
    std::optional<FillBand> band;
};

class FillBetweenPrimitive : public IPanePrimitive {
public:
    // Throws std::invalid_argument for an hline region whose sources are not constant levels
    FillBetweenPrimitive(const IChartHost& host, const ISeriesApi* backingSeries,
                         FillRegion region, ConditionalColor conditionalColor = {});

    void updateAllViews() override;
    std::vector<IPaneView*> paneViews() override { return {&m_view}; }
    std::optional<AutoscaleInfo> autoscaleInfo() const override;

    void updateSourceData(FillSource source1, FillSource source2);
    void updateOptions(const FillRegion& region);
    void setConditionalColor(ConditionalColor conditionalColor) { m_conditionalColor = std::move(conditionalColor); }

    const FillRegion& region() const { return m_region; }
    const FillGeometry& geometry() const { return m_view.geometry(); }

private:
    using Lookup = std::unordered_map<UnixTime, double>;

    static void validate(const FillRegion& region);
    static Lookup buildLookup(const FillSource& source);
    static std::optional<double> resolve(const FillSource& source, const Lookup& lookup, const SeriesPoint& bar);

    void updateBand(FillGeometry& geometry);
    void updateQuads(FillGeometry& geometry);
    QColor colorFor(const FillStep& step) const;

    static void draw(const FillGeometry& geometry, BitmapScope& scope);

    ShapeCoordinateResolver m_resolver;
    FillRegion m_region;
    ConditionalColor m_conditionalColor;
    Lookup m_lookup1;
    Lookup m_lookup2;

    // Parsed palette
    QColor m_color;
    QColor m_upColor;
    QColor m_downColor;
    QColor m_neutralColor;
    QColor m_topColor;
    QColor m_bottomColor;

    GeometryPaneView<FillGeometry> m_view;
};

} // namespace vantage
