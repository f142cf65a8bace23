#include "ShapeParser.hpp"
#include "../ParseUtils.hpp"
#include "../VantageLogging.hpp"

#include <algorithm>
#include <utility>

namespace vantage {

using ParseUtils::jsonNumber;
using ParseUtils::jsonString;

namespace {

template <typename Shape, typename ParseOne>
std::vector<Shape> parseEach(const Json& array, const char* what, ParseOne parseOne) {
    std::vector<Shape> out;
    if (!array.is_array()) return out;

    out.reserve(array.size());
    size_t skipped = 0;
    for (const auto& element : array) {
        try {
            if (auto shape = parseOne(element)) {
                out.push_back(std::move(*shape));
            } else {
                ++skipped;
            }
        } catch (const Json::exception& e) {
            ++skipped;
            vLog_Data("Malformed" << what << "element:" << e.what());
        }
    }
    if (skipped > 0) {
        vLog_Warning("Skipped" << skipped << "of" << array.size() << what << "elements");
    }
    return out;
}

std::optional<UnixTime> memberTime(const Json& element, const char* key) {
    auto it = element.find(key);
    if (it == element.end()) return std::nullopt;
    return TimeNormalizer::normalize(*it);
}

double numberOr(const Json& element, const char* key, double fallback) {
    auto v = jsonNumber(element, key);
    return (v && *v != 0.0) ? *v : fallback;
}

DashStyle dashStyleFromNode(const Json& element, const char* key) {
    auto it = element.find(key);
    if (it == element.end()) return DashStyle::Solid;
    if (it->is_string()) return dashStyleFromString(it->get_ref<const std::string&>());
    if (it->is_number_integer()) {
        switch (lineStyleFromNumber(it->get<int>())) {
            case LineStyle::Dotted:
            case LineStyle::SparseDotted: return DashStyle::Dotted;
            case LineStyle::Dashed:
            case LineStyle::LargeDashed:  return DashStyle::Dashed;
            default:                      return DashStyle::Solid;
        }
    }
    return DashStyle::Solid;
}

} // namespace

std::optional<BoxShape> ShapeParser::parseBox(const Json& element) {
    if (!element.is_object()) return std::nullopt;
    const auto t1 = memberTime(element, "time1");
    const auto t2 = memberTime(element, "time2");
    const auto p1 = jsonNumber(element, "price1");
    const auto p2 = jsonNumber(element, "price2");
    if (!t1 || !t2 || !p1 || !p2) return std::nullopt;

    BoxShape box;
    box.time1 = *t1;
    box.time2 = *t2;
    box.price1 = *p1;
    box.price2 = *p2;
    box.style.backgroundColor = jsonString(element, "backgroundColor", jsonString(element, "color"));
    box.style.borderColor = jsonString(element, "borderColor");
    box.style.borderWidth = numberOr(element, "borderWidth", 0.0);
    box.style.borderStyle = dashStyleFromNode(element, "borderStyle");
    box.style.text = jsonString(element, "text", jsonString(element, "label"));
    box.style.textColor = jsonString(element, "textColor");
    return box;
}

std::optional<LineShape> ShapeParser::parseLine(const Json& element) {
    if (!element.is_object()) return std::nullopt;
    const auto t1 = memberTime(element, "time1");
    const auto t2 = memberTime(element, "time2");
    const auto p1 = jsonNumber(element, "price1");
    const auto p2 = jsonNumber(element, "price2");
    if (!t1 || !t2 || !p1 || !p2) return std::nullopt;

    LineShape line;
    line.time1 = *t1;
    line.time2 = *t2;
    line.price1 = *p1;
    line.price2 = *p2;
    line.style.color = jsonString(element, "color");
    line.style.lineWidth = numberOr(element, "lineWidth", 1.0);
    line.style.lineStyle = dashStyleFromNode(element, "lineStyle");
    line.label = jsonString(element, "label");
    return line;
}

std::optional<ArrowShape> ShapeParser::parseArrow(const Json& element) {
    if (!element.is_object()) return std::nullopt;
    const auto t = memberTime(element, "time");
    const auto p = jsonNumber(element, "price");
    if (!t || !p) return std::nullopt;

    ArrowShape arrow;
    arrow.time = *t;
    arrow.price = *p;
    const std::string direction = jsonString(element, "direction", "up");
    auto parsed = arrowDirectionFromString(direction);
    if (!parsed) return std::nullopt;
    arrow.direction = *parsed;
    arrow.style.color = jsonString(element, "color");
    arrow.style.size = numberOr(element, "size", arrow.style.size);
    arrow.style.borderColor = jsonString(element, "borderColor");
    arrow.style.borderWidth = numberOr(element, "borderWidth", 0.0);
    arrow.style.text = jsonString(element, "text");
    arrow.style.textColor = jsonString(element, "textColor");
    return arrow;
}

std::optional<MarkerGlyphShape> ShapeParser::parseMarkerGlyph(const Json& element) {
    if (!element.is_object()) return std::nullopt;
    const auto t = memberTime(element, "time");
    const auto p = jsonNumber(element, "price");
    if (!t || !p) return std::nullopt;

    MarkerGlyphShape marker;
    marker.time = *t;
    marker.price = *p;
    auto shape = glyphShapeFromString(jsonString(element, "shape", "circle"));
    if (!shape) return std::nullopt;
    marker.shape = *shape;
    marker.style.color = jsonString(element, "color");
    marker.style.size = numberOr(element, "size", marker.style.size);
    marker.style.borderColor = jsonString(element, "borderColor");
    marker.style.borderWidth = numberOr(element, "borderWidth", 0.0);
    if (auto opacity = jsonNumber(element, "opacity")) {
        marker.style.opacity = std::clamp(*opacity, 0.0, 1.0);
    }
    marker.text = jsonString(element, "text");
    marker.textColor = jsonString(element, "textColor");
    return marker;
}

std::optional<MarkerSpec> ShapeParser::parseMarkerSpec(const Json& element) {
    if (!element.is_object()) return std::nullopt;
    const auto t = memberTime(element, "time");
    if (!t) return std::nullopt;

    MarkerSpec spec;
    spec.time = *t;
    spec.shape = jsonString(element, "shape", spec.shape);
    spec.position = jsonString(element, "position");
    spec.color = jsonString(element, "color");
    spec.size = numberOr(element, "size", spec.size);
    spec.text = jsonString(element, "text");
    spec.price = jsonNumber(element, "price");
    return spec;
}

std::vector<BoxShape> ShapeParser::parseBoxes(const Json& array) {
    return parseEach<BoxShape>(array, "box", &ShapeParser::parseBox);
}

std::vector<LineShape> ShapeParser::parseLines(const Json& array) {
    return parseEach<LineShape>(array, "line", &ShapeParser::parseLine);
}

std::vector<ArrowShape> ShapeParser::parseArrows(const Json& array) {
    return parseEach<ArrowShape>(array, "arrow", &ShapeParser::parseArrow);
}

std::vector<MarkerGlyphShape> ShapeParser::parseMarkerGlyphs(const Json& array) {
    return parseEach<MarkerGlyphShape>(array, "marker shape", &ShapeParser::parseMarkerGlyph);
}

std::vector<MarkerSpec> ShapeParser::parseMarkerSpecs(const Json& array) {
    return parseEach<MarkerSpec>(array, "marker", &ShapeParser::parseMarkerSpec);
}

std::vector<std::pair<UnixTime, double>> ShapeParser::parseValuePoints(const Json& array) {
    std::vector<std::pair<UnixTime, double>> out;
    if (!array.is_array()) return out;
    out.reserve(array.size());
    for (const auto& point : array) {
        auto time = TimeNormalizer::pointTime(point);
        if (!time) continue;
        std::optional<double> value;
        for (const char* key : {"value", "val", "v"}) {
            if (point.contains(key)) {
                value = jsonNumber(point[key]);
                break;
            }
        }
        if (value) out.emplace_back(*time, *value);
    }
    return out;
}

std::optional<FillSource> ShapeParser::parseFillSource(const Json& node, const Json& seriesMap) {
    if (node.is_string()) {
        const auto& name = node.get_ref<const std::string&>();
        if (seriesMap.is_object()) {
            auto it = seriesMap.find(name);
            if (it != seriesMap.end() && it->is_array()) {
                return ExternalSeries{parseValuePoints(*it)};
            }
        }
        if (auto component = priceComponentFromString(name)) return *component;
        if (auto level = ParseUtils::parseDouble(name)) return ConstantLevel{*level};
        return std::nullopt;
    }
    if (node.is_number()) {
        return ConstantLevel{node.get<double>()};
    }
    if (node.is_array()) {
        return ExternalSeries{parseValuePoints(node)};
    }
    return std::nullopt;
}

std::optional<FillRegion> ShapeParser::parseFillRegion(const Json& fillConfig, const Json& seriesMap) {
    if (!fillConfig.is_object()) return std::nullopt;

    FillRegion region;
    const std::string mode = jsonString(fillConfig, "mode", "series");
    region.mode = ParseUtils::equalsIgnoreCase(mode, "hline") ? FillMode::HLine : FillMode::Series;

    if (region.mode == FillMode::HLine) {
        const auto h1 = jsonNumber(fillConfig, "hline1");
        const auto h2 = jsonNumber(fillConfig, "hline2");
        if (!h1 || !h2) return std::nullopt;
        region.source1 = ConstantLevel{*h1};
        region.source2 = ConstantLevel{*h2};
    } else {
        const Json source1 = fillConfig.value("source1", Json("close"));
        auto s1 = parseFillSource(source1.is_null() ? Json("close") : source1, seriesMap);
        if (!s1) return std::nullopt;
        region.source1 = std::move(*s1);

        std::optional<FillSource> s2;
        auto it = fillConfig.find("source2");
        if (it != fillConfig.end() && !it->is_null()) {
            s2 = parseFillSource(*it, seriesMap);
        } else if (seriesMap.is_object() && !seriesMap.empty() && seriesMap.begin()->is_array()) {
            s2 = ExternalSeries{parseValuePoints(*seriesMap.begin())};
        }
        if (!s2) return std::nullopt;
        region.source2 = std::move(*s2);
    }

    const std::string colorMode = jsonString(fillConfig, "colorMode", "static");
    if (ParseUtils::equalsIgnoreCase(colorMode, "dynamic")) region.colorMode = FillColorMode::Dynamic;
    else if (ParseUtils::equalsIgnoreCase(colorMode, "gradient")) region.colorMode = FillColorMode::Gradient;
    else if (ParseUtils::equalsIgnoreCase(colorMode, "conditional")) region.colorMode = FillColorMode::Conditional;
    else region.colorMode = FillColorMode::Static;

    region.palette.color = jsonString(fillConfig, "color", jsonString(fillConfig, "fillColor", region.palette.color));
    region.palette.up = jsonString(fillConfig, "upFillColor", region.palette.up);
    region.palette.down = jsonString(fillConfig, "downFillColor", region.palette.down);
    region.palette.neutral = jsonString(fillConfig, "neutralFillColor", region.palette.neutral);
    region.palette.top = jsonString(fillConfig, "topColor");
    region.palette.bottom = jsonString(fillConfig, "bottomColor");

    region.fillGaps = !(fillConfig.contains("fillGaps") && fillConfig["fillGaps"].is_boolean() && !fillConfig["fillGaps"].get<bool>());
    region.display = !(fillConfig.contains("display") && fillConfig["display"].is_boolean() && !fillConfig["display"].get<bool>());
    return region;
}

} // namespace vantage
