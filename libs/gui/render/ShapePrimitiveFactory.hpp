#pragma once
#include "../host/ChartHost.hpp"
#include "primitives/FillBetweenPrimitive.hpp"

#include <memory>
#include <vector>

namespace vantage {

enum class ShapeKind { Box, Line, Arrow, MarkerGlyph };

const char* toString(ShapeKind kind);

struct CreatedPrimitive {
    ShapeKind kind;
    std::unique_ptr<IPanePrimitive> primitive;
    size_t shapeCount = 0;
};

/**
 * The one place shape descriptors turn into primitives. Descriptors are
 * partitioned by kind with a single std::visit; each non-empty kind becomes one
 * primitive. Constructor failures are logged and yield no primitive for that kind.
 */
class ShapePrimitiveFactory {
public:
    ShapePrimitiveFactory(const IChartHost& host, const ISeriesApi* backingSeries)
        : m_host(host), m_backing(backingSeries) {}

    std::vector<CreatedPrimitive> create(const std::vector<ShapeDescriptor>& shapes) const;

    std::unique_ptr<FillBetweenPrimitive> createFill(const FillRegion& region,
                                                     ConditionalColor conditionalColor = {}) const;

private:
    const IChartHost& m_host;
    const ISeriesApi* m_backing;
};

} // namespace vantage
