/*
Vantage — ShapeParser
Role: Turns producer JSON (shape arrays, fill configs, marker lists) into typed descriptors.
Inputs/Outputs: Json arrays/objects; outputs descriptor vectors and FillRegion.
Threading: Stateless.
Performance: Linear in element count.
Integration: Used by SeriesOverlayRegistry::addShapesFromApiResponse and by callers that
  build shapes from their own JSON.
Observability: Skipped elements are counted and reported through vLog_Data.
Related: ShapeParser.cpp, OverlayTypes.hpp.
Assumptions: A malformed element is skipped on its own; the rest of the array survives.
*/
#pragma once
#include "OverlayTypes.hpp"

#include "../VantageJson.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace vantage {

class ShapeParser {
public:
    static std::vector<BoxShape> parseBoxes(const Json& array);
    static std::vector<LineShape> parseLines(const Json& array);
    static std::vector<ArrowShape> parseArrows(const Json& array);
    static std::vector<MarkerGlyphShape> parseMarkerGlyphs(const Json& array);
    static std::vector<MarkerSpec> parseMarkerSpecs(const Json& array);

    static std::optional<BoxShape> parseBox(const Json& element);
    static std::optional<LineShape> parseLine(const Json& element);
    static std::optional<ArrowShape> parseArrow(const Json& element);
    static std::optional<MarkerGlyphShape> parseMarkerGlyph(const Json& element);
    static std::optional<MarkerSpec> parseMarkerSpec(const Json& element);

    // {time, value} points for an external fill source; zero values are kept
    static std::vector<std::pair<UnixTime, double>> parseValuePoints(const Json& array);

    // A fill source: series name (resolved against seriesMap), OHLC component name,
    // constant number, or inline point array
    static std::optional<FillSource> parseFillSource(const Json& node, const Json& seriesMap);

    // Full fill config; source2 defaults to the first series of seriesMap
    static std::optional<FillRegion> parseFillRegion(const Json& fillConfig,
                                                     const Json& seriesMap = Json::object());
};

} // namespace vantage
