/*
Vantage — OverlayTypes
Role: Domain vocabulary of the overlay engine: series points and kinds, shape descriptors,
  fill regions and marker specs.
Inputs/Outputs: Plain value types. Colours stay as CSS strings here; the GUI layer parses them.
Threading: Immutable once built; safe to copy across threads.
Performance: Small aggregates, passed by value or const reference.
Integration: Produced by SeriesTransform / ShapeParser, consumed by the registry and primitives.
Observability: None.
Related: OverlayTypes.cpp, ShapeParser.hpp, SeriesTransform.hpp.
Assumptions: Times are already normalized Unix seconds (TimeNormalizer).
*/
#pragma once
#include "../time/TimeNormalizer.hpp"

#include "../VantageJson.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vantage {

// =============================================================================
// SERIES
// =============================================================================

struct OhlcValue {
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
};

struct SeriesPoint {
    UnixTime time = 0;
    double value = 0.0;              // scalar value; close for OHLC points
    std::optional<OhlcValue> ohlc;
    std::string color;               // per-point colour (histogram bars)
};

enum class SeriesKind { Line, Area, Bar, Baseline, Histogram, Candlestick, Marker };

std::optional<SeriesKind> seriesKindFromString(std::string_view name);
const char* toString(SeriesKind kind);

inline bool isOhlcKind(SeriesKind kind) {
    return kind == SeriesKind::Candlestick || kind == SeriesKind::Bar;
}

// Series line style numbering used by indicator configs (0..4)
enum class LineStyle { Solid = 0, Dotted = 1, Dashed = 2, LargeDashed = 3, SparseDotted = 4 };

LineStyle lineStyleFromNumber(int value);

// Metadata entry of an API response: {seriesType, displayName, separatePane, config}
struct SeriesDescriptor {
    SeriesKind kind = SeriesKind::Line;
    std::string displayName;
    bool separatePane = false;
    Json config = Json::object();

    static SeriesDescriptor fromJson(const Json& metadata);
};

// Config of a marker-kind series (metadata.config)
struct MarkerSeriesConfig {
    std::string shape = "circle";
    std::string color = "#2196F3";
    double size = 1.0;
    std::string position = "inBar";
    std::string priceField = "value";
    std::string conditionField;           // empty: no filter
    Json conditionValue;        // null: no filter
    std::string text;

    static MarkerSeriesConfig fromJson(const Json& config, const Json& params);
    bool hasCondition() const { return !conditionField.empty() && !conditionValue.is_null(); }
};

// =============================================================================
// SHAPES
// =============================================================================

enum class DashStyle { Solid, Dashed, Dotted };

DashStyle dashStyleFromString(std::string_view name);
const char* toString(DashStyle style);

struct BoxStyle {
    std::string backgroundColor;     // empty: renderer default
    std::string borderColor;
    double borderWidth = 0.0;        // border drawn only when colour or width is set
    DashStyle borderStyle = DashStyle::Solid;
    std::string text;
    std::string textColor;
};

struct BoxShape {
    UnixTime time1 = 0;
    UnixTime time2 = 0;
    double price1 = 0.0;
    double price2 = 0.0;
    BoxStyle style;
};

struct LineShapeStyle {
    std::string color;               // empty: renderer default
    double lineWidth = 1.0;
    DashStyle lineStyle = DashStyle::Solid;
};

struct LineShape {
    UnixTime time1 = 0;
    UnixTime time2 = 0;
    double price1 = 0.0;
    double price2 = 0.0;
    LineShapeStyle style;
    std::string label;
};

enum class ArrowDirection { Up, Down, Left, Right, ArrowUp, ArrowDown };

std::optional<ArrowDirection> arrowDirectionFromString(std::string_view name);

struct ArrowStyle {
    std::string color;
    double size = 8.0;
    std::string borderColor;
    double borderWidth = 0.0;
    std::string text;
    std::string textColor;
};

struct ArrowShape {
    UnixTime time = 0;
    double price = 0.0;
    ArrowDirection direction = ArrowDirection::Up;
    ArrowStyle style;
};

enum class GlyphShape { Circle, Square, Diamond, Triangle, TriangleDown, Cross, X, Star };

std::optional<GlyphShape> glyphShapeFromString(std::string_view name);

struct MarkerGlyphStyle {
    std::string color;
    double size = 6.0;
    std::string borderColor;
    double borderWidth = 0.0;
    double opacity = 1.0;
};

struct MarkerGlyphShape {
    UnixTime time = 0;
    double price = 0.0;
    GlyphShape shape = GlyphShape::Circle;
    MarkerGlyphStyle style;
    std::string text;
    std::string textColor;
};

using ShapeDescriptor = std::variant<BoxShape, LineShape, ArrowShape, MarkerGlyphShape>;

// =============================================================================
// FILL REGIONS
// =============================================================================

enum class PriceComponent { Open, High, Low, Close, HL2, HLC3, OHLC4 };

std::optional<PriceComponent> priceComponentFromString(std::string_view name);
double priceComponentValue(PriceComponent component, const OhlcValue& bar);

struct ConstantLevel {
    double value = 0.0;
};

// External series; the fill primitive builds its time->value lookup from this
struct ExternalSeries {
    std::vector<std::pair<UnixTime, double>> points;
};

using FillSource = std::variant<ConstantLevel, PriceComponent, ExternalSeries>;

enum class FillMode { Series, HLine };
enum class FillColorMode { Static, Dynamic, Gradient, Conditional };

struct FillPalette {
    std::string color = "rgba(41, 98, 255, 0.1)";
    std::string up = "rgba(76, 175, 80, 0.15)";
    std::string down = "rgba(239, 83, 80, 0.15)";
    std::string neutral = "rgba(158, 158, 158, 0.1)";
    std::string top;                 // gradient; empty falls back to color
    std::string bottom;
};

struct FillRegion {
    FillMode mode = FillMode::Series;
    FillSource source1 = PriceComponent::Close;
    FillSource source2 = ConstantLevel{};
    FillColorMode colorMode = FillColorMode::Static;
    FillPalette palette;
    bool fillGaps = true;
    bool display = true;
};

// =============================================================================
// MARKERS
// =============================================================================

// Descriptive marker vocabulary accepted from producers before host mapping
struct MarkerSpec {
    UnixTime time = 0;
    std::string shape = "circle";    // circle | square | triangle | arrow
    std::string position;            // above | aboveBar | below | belowBar | inBar
    std::string color;
    double size = 1.0;
    std::string text;
    std::optional<double> price;
};

} // namespace vantage
