#include "ShapePrimitiveFactory.hpp"
#include "primitives/ArrowPrimitive.hpp"
#include "primitives/BoxPrimitive.hpp"
#include "primitives/LinePrimitive.hpp"
#include "primitives/MarkerGlyphPrimitive.hpp"
#include "../../core/VantageLogging.hpp"

#include <exception>
#include <type_traits>

namespace vantage {

const char* toString(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Box:         return "boxes";
        case ShapeKind::Line:        return "lines";
        case ShapeKind::Arrow:       return "arrows";
        case ShapeKind::MarkerGlyph: return "markerShapes";
    }
    return "unknown";
}

namespace {

template <typename Primitive, typename Shape>
void build(std::vector<CreatedPrimitive>& out, ShapeKind kind, const IChartHost& host,
           const ISeriesApi* backing, std::vector<Shape> shapes) {
    if (shapes.empty()) return;
    const size_t count = shapes.size();
    try {
        out.push_back(CreatedPrimitive{kind, std::make_unique<Primitive>(host, backing, std::move(shapes)), count});
    } catch (const std::exception& e) {
        vLog_Error("Failed to create" << toString(kind) << "primitive:" << e.what());
    }
}

} // namespace

std::vector<CreatedPrimitive> ShapePrimitiveFactory::create(const std::vector<ShapeDescriptor>& shapes) const {
    std::vector<BoxShape> boxes;
    std::vector<LineShape> lines;
    std::vector<ArrowShape> arrows;
    std::vector<MarkerGlyphShape> glyphs;

    for (const auto& shape : shapes) {
        std::visit([&](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, BoxShape>) boxes.push_back(s);
            else if constexpr (std::is_same_v<T, LineShape>) lines.push_back(s);
            else if constexpr (std::is_same_v<T, ArrowShape>) arrows.push_back(s);
            else if constexpr (std::is_same_v<T, MarkerGlyphShape>) glyphs.push_back(s);
        }, shape);
    }

    std::vector<CreatedPrimitive> out;
    build<BoxPrimitive>(out, ShapeKind::Box, m_host, m_backing, std::move(boxes));
    build<LinePrimitive>(out, ShapeKind::Line, m_host, m_backing, std::move(lines));
    build<ArrowPrimitive>(out, ShapeKind::Arrow, m_host, m_backing, std::move(arrows));
    build<MarkerGlyphPrimitive>(out, ShapeKind::MarkerGlyph, m_host, m_backing, std::move(glyphs));
    return out;
}

std::unique_ptr<FillBetweenPrimitive> ShapePrimitiveFactory::createFill(const FillRegion& region,
                                                                        ConditionalColor conditionalColor) const {
    try {
        return std::make_unique<FillBetweenPrimitive>(m_host, m_backing, region, std::move(conditionalColor));
    } catch (const std::exception& e) {
        vLog_Error("Failed to create fill primitive:" << e.what());
        return nullptr;
    }
}

} // namespace vantage
