/*
Vantage — SeriesOverlayRegistry Tests
Role: Verify indicator series registration, API response fan-out and shape/fill lifecycle
Testing Strategy: Fake chart host records series, attachments and marker publishes;
  API responses come from fixtures/api_responses.hpp
Coverage: Series add/update/remove, prefix removal, strategy series, option building,
  single/multi metadata responses, marker joins, shape section isolation, deferred attachment,
  fill replacement, main series switch
*/
#include <gtest/gtest.h>
#include "model/ShapeParser.hpp"
#include "overlay/SeriesOverlayRegistry.hpp"
#include "fixtures/api_responses.hpp"
#include "fixtures/fake_chart_host.hpp"

#include <QColor>

using namespace vantage;

namespace {

constexpr UnixTime kT0 = 1700000000;

SeriesDescriptor descriptorOf(SeriesKind kind, vantage::Json config = vantage::Json::object()) {
    SeriesDescriptor d;
    d.kind = kind;
    d.config = std::move(config);
    return d;
}

FillRegion hline(double a, double b) {
    FillRegion region;
    region.mode = FillMode::HLine;
    region.source1 = ConstantLevel{a};
    region.source2 = ConstantLevel{b};
    return region;
}

} // namespace

class OverlayRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        host.timeOrigin = kT0;
        host.secondsPerBar = 60.0;
        host.setReady(true);
        main = host.addCandles({kT0, kT0 + 60, kT0 + 120, kT0 + 180, kT0 + 240});
        registry.setMainSeries(main);
    }

    fixtures::FakeChartHost host;
    fixtures::FakeSeries* main = nullptr;
    SeriesOverlayRegistry registry{&host};
};

// =============================================================================
// Series
// =============================================================================

TEST_F(OverlayRegistryTest, AddSeriesTransformsPoints) {
    const auto points = fixtures::valuePoints({{kT0 + 60, 2.0}, {kT0, 1.0}, {(kT0 + 60) * 1000, 3.0}});
    ASSERT_TRUE(registry.addSeries("sma", points));

    ISeriesApi* handle = registry.seriesHandle("sma");
    ASSERT_NE(handle, nullptr);
    ASSERT_EQ(handle->data().size(), 2);
    EXPECT_EQ(handle->data()[0].time, kT0);
    // Millisecond duplicate of kT0 + 60 collapses, last one wins
    EXPECT_DOUBLE_EQ(handle->data()[1].value, 3.0);
}

TEST_F(OverlayRegistryTest, DuplicateAndEmptyRejected) {
    const auto points = fixtures::valuePoints({{kT0, 1.0}});
    ASSERT_TRUE(registry.addSeries("sma", points));
    EXPECT_FALSE(registry.addSeries("sma", points));
    EXPECT_FALSE(registry.addSeries("empty", vantage::Json::array()));
    EXPECT_FALSE(registry.addSeries("scalar", 42));
    EXPECT_EQ(registry.getAllSeriesIds(), std::vector<std::string>{"sma"});
}

TEST_F(OverlayRegistryTest, AllZeroSeriesRemovesHostSeries) {
    const size_t before = host.seriesCount();
    EXPECT_FALSE(registry.addSeries("zeros", fixtures::valuePoints({{kT0, 0.0}, {kT0 + 60, 0.0}})));
    EXPECT_EQ(host.seriesCount(), before);
    EXPECT_EQ(host.removedSeries, 1);
    EXPECT_FALSE(registry.hasSeries("zeros"));
}

TEST_F(OverlayRegistryTest, NoHostNoSeries) {
    SeriesOverlayRegistry detached(nullptr);
    EXPECT_FALSE(detached.addSeries("sma", fixtures::valuePoints({{kT0, 1.0}})));
}

TEST_F(OverlayRegistryTest, RemoveByPrefix) {
    const auto points = fixtures::valuePoints({{kT0, 1.0}});
    registry.addSeries("strategy_a_1", points);
    registry.addSeries("strategy_a_2", points);
    registry.addSeries("strategy_c_1", points);

    EXPECT_EQ(registry.removeSeriesByPrefix("strategy_a_"), 2);
    EXPECT_EQ(registry.getAllSeriesIds(), std::vector<std::string>{"strategy_c_1"});
    EXPECT_FALSE(registry.removeSeries("strategy_a_1"));
}

TEST_F(OverlayRegistryTest, UpdateReplacesData) {
    registry.addSeries("sma", fixtures::valuePoints({{kT0, 1.0}}));
    ASSERT_TRUE(registry.updateSeries("sma", fixtures::valuePoints({{kT0, 5.0}, {kT0 + 60, 6.0}})));

    EXPECT_EQ(registry.seriesHandle("sma")->data().size(), 2);
    EXPECT_FALSE(registry.updateSeries("missing", fixtures::valuePoints({{kT0, 1.0}})));
    EXPECT_FALSE(registry.updateSeries("sma", vantage::Json::array()));
    // Rejected update keeps the previous data
    EXPECT_EQ(registry.seriesHandle("sma")->data().size(), 2);
}

TEST_F(OverlayRegistryTest, ClearAllRemovesEverySeries) {
    const auto points = fixtures::valuePoints({{kT0, 1.0}});
    registry.addSeries("a", points);
    registry.addSeries("b", points);
    registry.clearAll();

    EXPECT_TRUE(registry.getAllSeriesIds().empty());
    EXPECT_EQ(host.seriesCount(), 1);   // main candles only
}

TEST_F(OverlayRegistryTest, OverlaysChangedSignal) {
    int changes = 0;
    QObject::connect(&registry, &SeriesOverlayRegistry::overlaysChanged, [&changes]() { ++changes; });

    registry.addSeries("a", fixtures::valuePoints({{kT0, 1.0}}));
    registry.removeSeries("a");
    EXPECT_EQ(changes, 2);
}

TEST_F(OverlayRegistryTest, FanOutAndPrefixRemovalSignalOnce) {
    int changes = 0;
    QObject::connect(&registry, &SeriesOverlayRegistry::overlaysChanged, [&changes]() { ++changes; });

    registry.addFromApiResponse("indicator_bb", fixtures::bandResponse());
    EXPECT_EQ(registry.getAllSeriesIds().size(), 2);
    EXPECT_EQ(changes, 1);

    const vantage::Json data{
        {"signals", fixtures::valuePoints({{kT0, 1.0}})},
        {"levels", fixtures::valuePoints({{kT0, 95.0}})},
    };
    EXPECT_EQ(registry.addStrategySeries("s", data), 2);
    EXPECT_EQ(changes, 2);

    EXPECT_EQ(registry.removeSeriesByPrefix("indicator_bb_"), 2);
    EXPECT_EQ(changes, 3);

    // Nothing added, nothing to announce
    registry.addFromApiResponse("empty", vantage::Json::object());
    EXPECT_EQ(registry.removeStrategy("missing"), 0);
    EXPECT_EQ(changes, 3);
}

// =============================================================================
// Series Options
// =============================================================================

TEST_F(OverlayRegistryTest, TitleDefaultsToUpperCasedId) {
    registry.addSeries("rsi_14", fixtures::valuePoints({{kT0, 50.0}}));
    EXPECT_EQ(registry.seriesHandle("rsi_14")->options().title, QStringLiteral("RSI_14"));
}

TEST_F(OverlayRegistryTest, SeparatePaneHistogramGetsOwnScale) {
    SeriesDescriptor d = descriptorOf(SeriesKind::Histogram);
    d.separatePane = true;
    registry.addSeries("macd_hist", fixtures::valuePoints({{kT0, 1.0}, {kT0 + 60, -1.0}}), d);

    const SeriesOptions& options = registry.seriesHandle("macd_hist")->options();
    EXPECT_EQ(options.priceScaleId, QStringLiteral("macd_hist"));
    EXPECT_DOUBLE_EQ(options.scaleMarginTop, OverlayDefaults::kSeparatePaneMarginTop);

    const auto& data = registry.seriesHandle("macd_hist")->data();
    ASSERT_EQ(data.size(), 2);
    EXPECT_NE(data[0].color, data[1].color);
}

TEST_F(OverlayRegistryTest, AreaColoursDeriveFromLineColour) {
    registry.addSeries("area", fixtures::valuePoints({{kT0, 1.0}}),
                       descriptorOf(SeriesKind::Area, {{"color", "#ff0000"}}));

    const SeriesOptions& options = registry.seriesHandle("area")->options();
    EXPECT_EQ(options.color, QColor(255, 0, 0));
    EXPECT_EQ(options.topColor.red(), 255);
    EXPECT_EQ(options.topColor.alpha(), OverlayDefaults::kAreaTopAlpha);
    EXPECT_EQ(options.bottomColor.alpha(), 0);
    EXPECT_FALSE(options.priceLineVisible);
}

TEST_F(OverlayRegistryTest, LineWidthFromConfigThenParams) {
    registry.addSeries("a", fixtures::valuePoints({{kT0, 1.0}}), descriptorOf(SeriesKind::Line, {{"lineWidth", 4}}));
    registry.addSeries("b", fixtures::valuePoints({{kT0, 1.0}}), descriptorOf(SeriesKind::Line), {{"lineWidth", 3}});
    registry.addSeries("c", fixtures::valuePoints({{kT0, 1.0}}));

    EXPECT_EQ(registry.seriesHandle("a")->options().lineWidth, 4);
    EXPECT_EQ(registry.seriesHandle("b")->options().lineWidth, 3);
    EXPECT_EQ(registry.seriesHandle("c")->options().lineWidth, OverlayDefaults::kLineWidth);
}

// =============================================================================
// Strategy Series
// =============================================================================

TEST_F(OverlayRegistryTest, StrategySeriesNamedBySection) {
    const vantage::Json data{
        {"signals", fixtures::valuePoints({{kT0, 1.0}})},
        {"trendline", fixtures::valuePoints({{kT0, 100.0}, {kT0 + 60, 101.0}})},
        {"levels", fixtures::valuePoints({{kT0, 95.0}})},
        {"custom", fixtures::valuePoints({{kT0, 7.0}})},
        {"ignored", vantage::Json::array()},
    };
    EXPECT_EQ(registry.addStrategySeries("breakout", data), 4);

    EXPECT_TRUE(registry.hasSeries("strategy_breakout_signals"));
    EXPECT_TRUE(registry.hasSeries("strategy_breakout_trend"));
    EXPECT_TRUE(registry.hasSeries("strategy_breakout_levels"));
    EXPECT_TRUE(registry.hasSeries("strategy_breakout_custom"));
    EXPECT_EQ(registry.seriesHandle("strategy_breakout_trend")->options().lineStyle, LineStyle::Dashed);

    EXPECT_EQ(registry.removeStrategy("breakout"), 4);
    EXPECT_TRUE(registry.getAllSeriesIds().empty());
}

TEST_F(OverlayRegistryTest, StrategyConfigOverridesKind) {
    const vantage::Json data{{"signals", fixtures::valuePoints({{kT0, 1.0}})}};
    const vantage::Json configs{{"signals", {{"type", "histogram"}, {"color", "#00ff00"}}}};
    registry.addStrategySeries("s", data, configs);
    EXPECT_EQ(registry.seriesKind("strategy_s_signals"), SeriesKind::Histogram);
}

// =============================================================================
// API Responses
// =============================================================================

TEST_F(OverlayRegistryTest, MultiEntryMetadataFansOut) {
    const ApiIngestResult result = registry.addFromApiResponse("indicator_bb", fixtures::bandResponse());

    EXPECT_TRUE(result.seriesAdded);
    EXPECT_FALSE(result.anyShapes());
    EXPECT_EQ(registry.getAllSeriesIds(), (std::vector<std::string>{"indicator_bb_lower", "indicator_bb_upper"}));
    EXPECT_DOUBLE_EQ(registry.seriesHandle("indicator_bb_upper")->data()[0].value, 110.0);
    EXPECT_EQ(registry.seriesHandle("indicator_bb_lower")->options().title, QStringLiteral("Lower"));
}

TEST_F(OverlayRegistryTest, SingleEntryMatchedWithoutIndicatorPrefix) {
    registry.addFromApiResponse("indicator_volume", fixtures::singleSeriesResponse("volume", "histogram"));
    EXPECT_EQ(registry.seriesKind("indicator_volume"), SeriesKind::Histogram);
    EXPECT_EQ(registry.seriesHandle("indicator_volume")->data().size(), 3);
}

TEST_F(OverlayRegistryTest, SingleEntryFallsBackToFirstDescriptor) {
    registry.addFromApiResponse("custom_id", fixtures::singleSeriesResponse("ema", "area"));
    EXPECT_EQ(registry.seriesKind("custom_id"), SeriesKind::Area);
}

TEST_F(OverlayRegistryTest, FirstEntryFallbacksFollowProducerOrder) {
    const vantage::Json response{
        {"metadata", {
            {"trailingStop", {{"seriesType", "area"}}},
            {"atr", {{"seriesType", "histogram"}}}
        }},
        {"series", {
            {"trailingStop", fixtures::valuePoints({{kT0, 95.0}, {kT0 + 60, 96.0}})},
            {"atr", fixtures::valuePoints({{kT0, 1.5}})}
        }}
    };

    // Two entries fan out; "atr" has its own data
    registry.addFromApiResponse("indicator_ts", response);
    EXPECT_DOUBLE_EQ(registry.seriesHandle("indicator_ts_atr")->data()[0].value, 1.5);

    vantage::Json single = response;
    single["metadata"].erase("atr");
    registry.addFromApiResponse("custom", single);
    EXPECT_EQ(registry.seriesKind("custom"), SeriesKind::Area);
    ASSERT_EQ(registry.seriesHandle("custom")->data().size(), 2);
    EXPECT_DOUBLE_EQ(registry.seriesHandle("custom")->data()[0].value, 95.0);

    vantage::Json bare{{"series", single["series"]}};
    registry.addFromApiResponse("bare", bare);
    EXPECT_DOUBLE_EQ(registry.seriesHandle("bare")->data()[0].value, 95.0);
}

TEST_F(OverlayRegistryTest, MissingMetadataUsesLineDefaults) {
    vantage::Json response{{"series", {{"x", fixtures::valuePoints({{kT0, 1.0}})}}}};
    EXPECT_TRUE(registry.addFromApiResponse("plain", response).seriesAdded);
    EXPECT_EQ(registry.seriesKind("plain"), SeriesKind::Line);
}

TEST_F(OverlayRegistryTest, NonObjectResponseIgnored) {
    EXPECT_FALSE(registry.addFromApiResponse("x", vantage::Json::array()).seriesAdded);
    EXPECT_TRUE(registry.getAllSeriesIds().empty());
}

TEST_F(OverlayRegistryTest, MarkerSeriesJoinsPriceAndCondition) {
    registry.addFromApiResponse("indicator_trail", fixtures::trailResponse());

    EXPECT_TRUE(registry.hasSeries("indicator_trail_trailingStop"));
    EXPECT_EQ(registry.seriesKind("indicator_trail_signal"), SeriesKind::Marker);
    EXPECT_EQ(registry.seriesHandle("indicator_trail_signal"), nullptr);

    const auto& markers = registry.markers().visibleMarkers();
    ASSERT_EQ(markers.size(), 1);
    EXPECT_EQ(markers[0].time, 1);
    EXPECT_EQ(markers[0].position, MarkerPosition::BelowBar);
    EXPECT_EQ(markers[0].shape, MarkerShape::ArrowUp);

    // Published once through the main series' layer
    ASSERT_FALSE(host.markerPublishes.empty());
    EXPECT_EQ(host.markerLayerSeries.front(), main);

    EXPECT_TRUE(registry.removeSeries("indicator_trail_signal"));
    EXPECT_TRUE(registry.markers().visibleMarkers().empty());
}

TEST_F(OverlayRegistryTest, MarkerSeriesRederivedOnUpdate) {
    registry.addFromApiResponse("indicator_trail", fixtures::trailResponse());
    const vantage::Json joined = vantage::Json::array({
        {{"time", 5}, {"trailingStop", 20.0}, {"signal", 1}},
        {{"time", 6}, {"trailingStop", 21.0}, {"signal", 1}},
    });
    ASSERT_TRUE(registry.updateSeries("indicator_trail_signal", joined));
    EXPECT_EQ(registry.markers().visibleMarkers().size(), 2);
}

// =============================================================================
// Shapes
// =============================================================================

TEST_F(OverlayRegistryTest, ShapesNeedMainSeries) {
    SeriesOverlayRegistry bare(&host);
    EXPECT_FALSE(bare.addLines(ShapeParser::parseLines(fixtures::lines())));
    EXPECT_FALSE(bare.addFillBetween("f", hline(1, 2)));
}

TEST_F(OverlayRegistryTest, FullShapePayloadAttachesEverySection) {
    const ApiIngestResult result =
        registry.addShapesFromApiResponse("trail", fixtures::fullShapes(), fixtures::trailSeriesMap());

    EXPECT_TRUE(result.markers);
    EXPECT_TRUE(result.lines);
    EXPECT_TRUE(result.boxes);
    EXPECT_TRUE(result.arrows);
    EXPECT_TRUE(result.markerShapes);
    EXPECT_EQ(result.fills, 2);

    EXPECT_EQ(registry.primitiveCount(ShapeKind::Line), 1);
    EXPECT_EQ(registry.attachedPrimitiveCount(), 6);
    EXPECT_EQ(host.attached.size(), 6);
    EXPECT_TRUE(registry.hasFill("fill_trail_0"));
    EXPECT_TRUE(registry.hasFill("fill_trail_1"));
    EXPECT_FALSE(registry.hasFill("fill_trail_2"));
    EXPECT_TRUE(registry.markers().hasSet("trail_markers"));
}

TEST_F(OverlayRegistryTest, MalformedSectionDoesNotBlockOthers) {
    vantage::Json shapes = fixtures::fullShapes();
    shapes["lines"] = "not an array";

    const ApiIngestResult result = registry.addShapesFromApiResponse("x", shapes, fixtures::trailSeriesMap());
    EXPECT_FALSE(result.lines);
    EXPECT_TRUE(result.boxes);
    EXPECT_TRUE(result.arrows);
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Line), 0);
}

TEST_F(OverlayRegistryTest, AttachDeferredUntilHostReady) {
    fixtures::FakeChartHost lateHost;
    lateHost.timeOrigin = kT0;
    lateHost.secondsPerBar = 60.0;
    auto* candles = lateHost.addCandles({kT0, kT0 + 60});
    SeriesOverlayRegistry late(&lateHost);
    late.setMainSeries(candles);

    ASSERT_TRUE(late.addBoxes(ShapeParser::parseBoxes(fixtures::boxes())));
    ASSERT_TRUE(late.addFillBetween("band", hline(105, 95)));
    EXPECT_EQ(late.attachedPrimitiveCount(), 0);
    EXPECT_TRUE(lateHost.attached.empty());

    lateHost.setReady(true);
    EXPECT_EQ(late.attachedPrimitiveCount(), 2);
    EXPECT_EQ(lateHost.attached.size(), 2);
    EXPECT_GT(lateHost.repaints, 0);
}

TEST_F(OverlayRegistryTest, RemovedBeforeAttachNeverAttaches) {
    fixtures::FakeChartHost lateHost;
    auto* candles = lateHost.addCandles({kT0});
    SeriesOverlayRegistry late(&lateHost);
    late.setMainSeries(candles);

    late.addLines(ShapeParser::parseLines(fixtures::lines()));
    late.removeAllLines();
    lateHost.setReady(true);

    EXPECT_TRUE(lateHost.attached.empty());
    EXPECT_EQ(lateHost.attachCalls, 0);
}

TEST_F(OverlayRegistryTest, UpdateLinesReplacesPrimitive) {
    registry.addLines(ShapeParser::parseLines(fixtures::lines()));
    ASSERT_EQ(host.attached.size(), 1);
    IPanePrimitive* first = host.attached.front();

    ASSERT_TRUE(registry.updateLines(ShapeParser::parseLines(fixtures::lines())));
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Line), 1);
    ASSERT_EQ(host.attached.size(), 1);
    EXPECT_EQ(host.detachCalls, 1);
    EXPECT_NE(host.attached.front(), first);
}

TEST_F(OverlayRegistryTest, EmptyShapeListRejected) {
    EXPECT_FALSE(registry.addBoxes({}));
    EXPECT_EQ(registry.attachedPrimitiveCount(), 0);
}

TEST_F(OverlayRegistryTest, KindScopedRemovalLeavesOtherKinds) {
    ASSERT_TRUE(registry.addBoxes(ShapeParser::parseBoxes(fixtures::boxes())));
    ASSERT_TRUE(registry.addArrows(ShapeParser::parseArrows(fixtures::arrows())));
    ASSERT_TRUE(registry.addMarkerShapes(ShapeParser::parseMarkerGlyphs(fixtures::markerShapes())));
    ASSERT_EQ(host.attached.size(), 3);

    registry.removeAllArrows();
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Arrow), 0);
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Box), 1);
    EXPECT_EQ(registry.primitiveCount(ShapeKind::MarkerGlyph), 1);
    EXPECT_EQ(host.attached.size(), 2);

    // Removing a kind with nothing attached is a no-op
    registry.removeAllArrows();
    EXPECT_EQ(host.detachCalls, 1);

    registry.removeAllBoxes();
    registry.removeAllMarkerShapes();
    EXPECT_TRUE(host.attached.empty());
}

TEST_F(OverlayRegistryTest, UpdateByKindReplacesOnlyThatKind) {
    registry.addBoxes(ShapeParser::parseBoxes(fixtures::boxes()));
    registry.addArrows(ShapeParser::parseArrows(fixtures::arrows()));
    registry.addMarkerShapes(ShapeParser::parseMarkerGlyphs(fixtures::markerShapes()));

    ASSERT_TRUE(registry.updateBoxes(ShapeParser::parseBoxes(fixtures::boxes())));
    ASSERT_TRUE(registry.updateArrows(ShapeParser::parseArrows(fixtures::arrows())));
    ASSERT_TRUE(registry.updateMarkerShapes(ShapeParser::parseMarkerGlyphs(fixtures::markerShapes())));
    EXPECT_EQ(host.detachCalls, 3);
    EXPECT_EQ(host.attached.size(), 3);

    // An empty update clears the kind and reports nothing added
    EXPECT_FALSE(registry.updateArrows({}));
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Arrow), 0);
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Box), 1);
}

// =============================================================================
// Marker Sets
// =============================================================================

TEST_F(OverlayRegistryTest, ShapeMarkersPublishedAndRemoved) {
    MarkerSpec marker;
    marker.time = kT0 + 60;
    marker.position = "above";

    ASSERT_TRUE(registry.addShapeMarkers("signals", {marker}));
    EXPECT_TRUE(registry.markers().hasSet("signals"));
    ASSERT_FALSE(host.markerPublishes.empty());
    EXPECT_EQ(host.markerPublishes.back().size(), 1);

    EXPECT_FALSE(registry.addShapeMarkers("empty", {}));

    EXPECT_TRUE(registry.removeShapeMarkers("signals"));
    EXPECT_FALSE(registry.removeShapeMarkers("signals"));
    EXPECT_TRUE(host.markerPublishes.back().empty());
}

TEST_F(OverlayRegistryTest, ShapeMarkersNeedMainSeries) {
    SeriesOverlayRegistry bare(&host);
    MarkerSpec marker;
    marker.time = kT0;
    EXPECT_FALSE(bare.addShapeMarkers("signals", {marker}));
}

// =============================================================================
// Fills
// =============================================================================

TEST_F(OverlayRegistryTest, DuplicateFillIdReplaces) {
    ASSERT_TRUE(registry.addFillBetween("band", hline(105, 95)));
    ASSERT_TRUE(registry.addFillBetween("band", hline(110, 90)));

    EXPECT_EQ(registry.fillIds(), std::vector<std::string>{"band"});
    EXPECT_EQ(host.attached.size(), 1);
    EXPECT_EQ(host.detachCalls, 1);
}

TEST_F(OverlayRegistryTest, RemoveFillById) {
    registry.addFillBetween("a", hline(105, 95));
    registry.addFillBetween("b", hline(110, 90));

    EXPECT_TRUE(registry.removeFillBetween("a"));
    EXPECT_FALSE(registry.removeFillBetween("a"));
    EXPECT_EQ(registry.fillIds(), std::vector<std::string>{"b"});
    EXPECT_EQ(host.attached.size(), 1);

    registry.removeAllFillBetween();
    EXPECT_TRUE(registry.fillIds().empty());
    EXPECT_TRUE(host.attached.empty());
}

TEST_F(OverlayRegistryTest, InvalidFillRejected) {
    FillRegion region = hline(1, 2);
    region.source2 = PriceComponent::Close;
    EXPECT_FALSE(registry.addFillBetween("bad", region));
    EXPECT_FALSE(registry.hasFill("bad"));
}

TEST_F(OverlayRegistryTest, FillUpdatesValidated) {
    registry.addFillBetween("band", hline(105, 95));

    FillRegion invalid = hline(1, 2);
    invalid.source1 = PriceComponent::High;
    EXPECT_FALSE(registry.updateFillBetween("band", invalid));
    EXPECT_TRUE(registry.updateFillBetween("band", hline(120, 80)));
    EXPECT_FALSE(registry.updateFillBetween("missing", hline(1, 2)));

    EXPECT_FALSE(registry.updateFillSources("band", PriceComponent::Close, ConstantLevel{1}));
    EXPECT_TRUE(registry.updateFillSources("band", ConstantLevel{3}, ConstantLevel{4}));
}

TEST_F(OverlayRegistryTest, RemoveShapesDropsMarkersAndFillsForId) {
    registry.addShapesFromApiResponse("a", fixtures::fullShapes(), fixtures::trailSeriesMap());
    registry.addFillBetween("fill_b_0", hline(1, 2));

    registry.removeShapes("a");

    EXPECT_FALSE(registry.markers().hasSet("a_markers"));
    EXPECT_EQ(registry.fillIds(), std::vector<std::string>{"fill_b_0"});
    // Kind-wide primitives stay until removed by kind
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Box), 1);
}

TEST_F(OverlayRegistryTest, ClearAllShapesDetachesEverything) {
    registry.addShapesFromApiResponse("a", fixtures::fullShapes(), fixtures::trailSeriesMap());
    registry.clearAllShapes();

    EXPECT_TRUE(host.attached.empty());
    EXPECT_EQ(registry.attachedPrimitiveCount(), 0);
    EXPECT_TRUE(registry.fillIds().empty());
    EXPECT_TRUE(registry.markers().setNames().empty());
}

// =============================================================================
// Main Series
// =============================================================================

TEST_F(OverlayRegistryTest, SwitchingMainSeriesDropsPrimitivesAndMovesMarkers) {
    registry.addShapesFromApiResponse("a", fixtures::fullShapes(), fixtures::trailSeriesMap());
    ASSERT_FALSE(host.attached.empty());

    auto* other = host.addCandles({kT0, kT0 + 60});
    registry.setMainSeries(other);

    EXPECT_TRUE(host.attached.empty());
    EXPECT_EQ(registry.primitiveCount(ShapeKind::Line), 0);
    EXPECT_TRUE(registry.fillIds().empty());
    EXPECT_EQ(registry.mainSeries(), other);

    // Marker sets survive and are republished through the new series' layer
    EXPECT_TRUE(registry.markers().hasSet("a_markers"));
    EXPECT_EQ(host.markerLayerSeries.back(), other);
}
