#include "OverlayTypes.hpp"
#include "../ParseUtils.hpp"

namespace vantage {

using ParseUtils::equalsIgnoreCase;

std::optional<SeriesKind> seriesKindFromString(std::string_view name) {
    if (equalsIgnoreCase(name, "line")) return SeriesKind::Line;
    if (equalsIgnoreCase(name, "area")) return SeriesKind::Area;
    if (equalsIgnoreCase(name, "bar")) return SeriesKind::Bar;
    if (equalsIgnoreCase(name, "baseline")) return SeriesKind::Baseline;
    if (equalsIgnoreCase(name, "histogram")) return SeriesKind::Histogram;
    if (equalsIgnoreCase(name, "candlestick")) return SeriesKind::Candlestick;
    if (equalsIgnoreCase(name, "marker")) return SeriesKind::Marker;
    return std::nullopt;
}

const char* toString(SeriesKind kind) {
    switch (kind) {
        case SeriesKind::Line:        return "line";
        case SeriesKind::Area:        return "area";
        case SeriesKind::Bar:         return "bar";
        case SeriesKind::Baseline:    return "baseline";
        case SeriesKind::Histogram:   return "histogram";
        case SeriesKind::Candlestick: return "candlestick";
        case SeriesKind::Marker:      return "marker";
    }
    return "line";
}

LineStyle lineStyleFromNumber(int value) {
    switch (value) {
        case 1:  return LineStyle::Dotted;
        case 2:  return LineStyle::Dashed;
        case 3:  return LineStyle::LargeDashed;
        case 4:  return LineStyle::SparseDotted;
        default: return LineStyle::Solid;
    }
}

SeriesDescriptor SeriesDescriptor::fromJson(const Json& metadata) {
    SeriesDescriptor d;
    if (!metadata.is_object()) return d;

    // Unknown series types render as lines
    const std::string type = ParseUtils::jsonString(metadata, "seriesType", "line");
    d.kind = seriesKindFromString(type).value_or(SeriesKind::Line);
    d.displayName = ParseUtils::jsonString(metadata, "displayName");
    d.separatePane = ParseUtils::jsonTruthy(metadata, "separatePane");
    if (auto it = metadata.find("config"); it != metadata.end() && it->is_object()) {
        d.config = *it;
    }
    return d;
}

MarkerSeriesConfig MarkerSeriesConfig::fromJson(const Json& config, const Json& params) {
    MarkerSeriesConfig c;
    c.shape = ParseUtils::jsonString(config, "shape", c.shape);
    c.color = ParseUtils::jsonString(config, "color", ParseUtils::jsonString(params, "color", c.color));
    if (auto size = ParseUtils::jsonNumber(config, "size"); size && *size != 0.0) c.size = *size;
    c.position = ParseUtils::jsonString(config, "position", c.position);
    c.priceField = ParseUtils::jsonString(config, "priceField", c.priceField);
    c.conditionField = ParseUtils::jsonString(config, "conditionField");
    if (config.is_object() && config.contains("conditionValue")) {
        c.conditionValue = config["conditionValue"];
    }
    c.text = ParseUtils::jsonString(config, "text");
    return c;
}

DashStyle dashStyleFromString(std::string_view name) {
    if (equalsIgnoreCase(name, "dashed")) return DashStyle::Dashed;
    if (equalsIgnoreCase(name, "dotted")) return DashStyle::Dotted;
    return DashStyle::Solid;
}

const char* toString(DashStyle style) {
    switch (style) {
        case DashStyle::Dashed: return "dashed";
        case DashStyle::Dotted: return "dotted";
        default:                return "solid";
    }
}

std::optional<ArrowDirection> arrowDirectionFromString(std::string_view name) {
    if (equalsIgnoreCase(name, "up")) return ArrowDirection::Up;
    if (equalsIgnoreCase(name, "down")) return ArrowDirection::Down;
    if (equalsIgnoreCase(name, "left")) return ArrowDirection::Left;
    if (equalsIgnoreCase(name, "right")) return ArrowDirection::Right;
    if (equalsIgnoreCase(name, "arrow-up")) return ArrowDirection::ArrowUp;
    if (equalsIgnoreCase(name, "arrow-down")) return ArrowDirection::ArrowDown;
    return std::nullopt;
}

std::optional<GlyphShape> glyphShapeFromString(std::string_view name) {
    if (equalsIgnoreCase(name, "circle")) return GlyphShape::Circle;
    if (equalsIgnoreCase(name, "square")) return GlyphShape::Square;
    if (equalsIgnoreCase(name, "diamond")) return GlyphShape::Diamond;
    if (equalsIgnoreCase(name, "triangle")) return GlyphShape::Triangle;
    if (equalsIgnoreCase(name, "triangle-down")) return GlyphShape::TriangleDown;
    if (equalsIgnoreCase(name, "cross")) return GlyphShape::Cross;
    if (equalsIgnoreCase(name, "x")) return GlyphShape::X;
    if (equalsIgnoreCase(name, "star")) return GlyphShape::Star;
    return std::nullopt;
}

std::optional<PriceComponent> priceComponentFromString(std::string_view name) {
    if (equalsIgnoreCase(name, "open")) return PriceComponent::Open;
    if (equalsIgnoreCase(name, "high")) return PriceComponent::High;
    if (equalsIgnoreCase(name, "low")) return PriceComponent::Low;
    if (equalsIgnoreCase(name, "close")) return PriceComponent::Close;
    if (equalsIgnoreCase(name, "hl2")) return PriceComponent::HL2;
    if (equalsIgnoreCase(name, "hlc3")) return PriceComponent::HLC3;
    if (equalsIgnoreCase(name, "ohlc4")) return PriceComponent::OHLC4;
    return std::nullopt;
}

double priceComponentValue(PriceComponent component, const OhlcValue& bar) {
    switch (component) {
        case PriceComponent::Open:  return bar.open;
        case PriceComponent::High:  return bar.high;
        case PriceComponent::Low:   return bar.low;
        case PriceComponent::Close: return bar.close;
        case PriceComponent::HL2:   return (bar.high + bar.low) / 2.0;
        case PriceComponent::HLC3:  return (bar.high + bar.low + bar.close) / 3.0;
        case PriceComponent::OHLC4: return (bar.open + bar.high + bar.low + bar.close) / 4.0;
    }
    return bar.close;
}

} // namespace vantage
