/*
Vantage — ShapeParser Tests
Role: Verify producer shape JSON → typed descriptors, and fill configs → FillRegion
Testing Strategy: Golden JSON fixtures per shape kind → assert descriptor fields
Coverage: Boxes, lines, arrows, marker glyphs, marker specs, per-element skipping,
  fill source resolution (series key, price component, constant, inline array), hline fills
*/
#include <gtest/gtest.h>
#include "model/ShapeParser.hpp"
#include "fixtures/shape_payloads.hpp"

using namespace vantage;
using json = vantage::Json;

// =============================================================================
// Shapes
// =============================================================================

TEST(ShapeParser, BoxWithFullStyle) {
    auto boxes = ShapeParser::parseBoxes(fixtures::boxes());

    ASSERT_EQ(boxes.size(), 1);
    EXPECT_EQ(boxes[0].time1, 1700000000);
    EXPECT_EQ(boxes[0].time2, 1700003600);
    EXPECT_DOUBLE_EQ(boxes[0].price1, 100.0);
    EXPECT_DOUBLE_EQ(boxes[0].price2, 90.0);
    EXPECT_EQ(boxes[0].style.backgroundColor, "rgba(255, 0, 0, 0.2)");
    EXPECT_EQ(boxes[0].style.borderStyle, DashStyle::Dashed);
    EXPECT_EQ(boxes[0].style.text, "zone");
}

TEST(ShapeParser, BoxBackgroundFallsBackToColor) {
    auto box = ShapeParser::parseBox({{"time1", 1}, {"time2", 2}, {"price1", 1}, {"price2", 2}, {"color", "#abcdef"}});
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->style.backgroundColor, "#abcdef");
}

TEST(ShapeParser, LineStyleFromNumberOrName) {
    auto lines = ShapeParser::parseLines(fixtures::lines());

    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[0].style.lineStyle, DashStyle::Dashed);
    EXPECT_EQ(lines[0].label, "support");
    EXPECT_EQ(lines[1].style.lineStyle, DashStyle::Dotted);
    EXPECT_DOUBLE_EQ(lines[1].style.lineWidth, 1.0);
}

TEST(ShapeParser, MalformedElementsSkippedIndividually) {
    json array = fixtures::lines();
    array.push_back({{"time1", 1}, {"price1", 2}});            // missing time2/price2
    array.push_back("garbage");
    array.push_back({{"time1", "x"}, {"time2", 2}, {"price1", 1}, {"price2", 1}});

    auto lines = ShapeParser::parseLines(array);
    EXPECT_EQ(lines.size(), 2);
}

TEST(ShapeParser, ArrowDirectionDefaultsUp) {
    auto arrows = ShapeParser::parseArrows(fixtures::arrows());

    ASSERT_EQ(arrows.size(), 2);
    EXPECT_EQ(arrows[0].direction, ArrowDirection::Up);
    EXPECT_EQ(arrows[1].direction, ArrowDirection::ArrowDown);
    EXPECT_EQ(arrows[1].style.text, "sell");
}

TEST(ShapeParser, UnknownArrowDirectionRejected) {
    EXPECT_FALSE(ShapeParser::parseArrow({{"time", 1}, {"price", 1}, {"direction", "sideways"}}).has_value());
}

TEST(ShapeParser, MarkerGlyphOpacityClamped) {
    auto glyph = ShapeParser::parseMarkerGlyph({{"time", 1}, {"price", 5}, {"shape", "star"}, {"opacity", 3.0}});
    ASSERT_TRUE(glyph.has_value());
    EXPECT_EQ(glyph->shape, GlyphShape::Star);
    EXPECT_DOUBLE_EQ(glyph->style.opacity, 1.0);
}

TEST(ShapeParser, MarkerSpecsKeepOptionalPrice) {
    auto specs = ShapeParser::parseMarkerSpecs(json::array({
        {{"time", 1}, {"position", "aboveBar"}, {"shape", "arrow"}},
        {{"time", 2}, {"price", 42.5}},
    }));

    ASSERT_EQ(specs.size(), 2);
    EXPECT_FALSE(specs[0].price.has_value());
    EXPECT_EQ(specs[0].shape, "arrow");
    ASSERT_TRUE(specs[1].price.has_value());
    EXPECT_DOUBLE_EQ(*specs[1].price, 42.5);
    EXPECT_EQ(specs[1].shape, "circle");
}

// =============================================================================
// Fill Regions
// =============================================================================

TEST(ShapeParser, FillSourceResolvesSeriesKeyFirst) {
    json seriesMap = {{"close", json::array({{{"time", 1}, {"value", 7.0}}})}};

    auto source = ShapeParser::parseFillSource("close", seriesMap);
    ASSERT_TRUE(source.has_value());
    // A series named like a price component shadows the component
    auto* external = std::get_if<ExternalSeries>(&*source);
    ASSERT_NE(external, nullptr);
    ASSERT_EQ(external->points.size(), 1);
    EXPECT_DOUBLE_EQ(external->points[0].second, 7.0);
}

TEST(ShapeParser, FillSourceVariants) {
    json seriesMap = json::object();

    auto component = ShapeParser::parseFillSource("hl2", seriesMap);
    ASSERT_TRUE(component.has_value());
    EXPECT_EQ(std::get<PriceComponent>(*component), PriceComponent::HL2);

    auto constant = ShapeParser::parseFillSource(70, seriesMap);
    ASSERT_TRUE(constant.has_value());
    EXPECT_DOUBLE_EQ(std::get<ConstantLevel>(*constant).value, 70.0);

    auto numericString = ShapeParser::parseFillSource("30.5", seriesMap);
    ASSERT_TRUE(numericString.has_value());
    EXPECT_DOUBLE_EQ(std::get<ConstantLevel>(*numericString).value, 30.5);

    EXPECT_FALSE(ShapeParser::parseFillSource("nonexistent", seriesMap).has_value());
}

TEST(ShapeParser, SeriesFillAgainstNamedSeries) {
    auto region = ShapeParser::parseFillRegion(fixtures::seriesFill(), fixtures::trailSeriesMap());

    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->mode, FillMode::Series);
    EXPECT_EQ(std::get<PriceComponent>(region->source1), PriceComponent::Close);
    ASSERT_TRUE(std::holds_alternative<ExternalSeries>(region->source2));
    EXPECT_EQ(std::get<ExternalSeries>(region->source2).points.size(), 3);
    EXPECT_EQ(region->colorMode, FillColorMode::Dynamic);
    EXPECT_EQ(region->palette.up, "rgba(0, 200, 0, 0.2)");
}

TEST(ShapeParser, SeriesFillWithoutSource2UsesFirstSeries) {
    json config = {{"source1", "close"}};
    auto region = ShapeParser::parseFillRegion(config, fixtures::trailSeriesMap());

    ASSERT_TRUE(region.has_value());
    ASSERT_TRUE(std::holds_alternative<ExternalSeries>(region->source2));
    // trailingStop is listed first even though "signal" sorts before it
    const auto& points = std::get<ExternalSeries>(region->source2).points;
    ASSERT_EQ(points.size(), 3);
    EXPECT_DOUBLE_EQ(points[0].second, 95.0);
}

TEST(ShapeParser, HLineFillNeedsBothLevels) {
    auto region = ShapeParser::parseFillRegion({{"mode", "hline"}, {"hline1", 70}, {"hline2", 30}}, json::object());
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->mode, FillMode::HLine);
    EXPECT_DOUBLE_EQ(std::get<ConstantLevel>(region->source1).value, 70.0);
    EXPECT_DOUBLE_EQ(std::get<ConstantLevel>(region->source2).value, 30.0);

    EXPECT_FALSE(ShapeParser::parseFillRegion({{"mode", "hline"}, {"hline1", 70}}, json::object()).has_value());
}

TEST(ShapeParser, FillFlagsDefaultOn) {
    auto region = ShapeParser::parseFillRegion({{"mode", "hline"}, {"hline1", 1}, {"hline2", 2},
                                                {"display", false}}, json::object());
    ASSERT_TRUE(region.has_value());
    EXPECT_FALSE(region->display);
    EXPECT_TRUE(region->fillGaps);
}
