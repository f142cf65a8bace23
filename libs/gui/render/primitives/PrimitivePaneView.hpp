#pragma once
#include "../../host/ChartHost.hpp"

#include <functional>

namespace vantage {

/**
 * Single pane view shared by the shape primitives. The primitive fills the
 * geometry in updateAllViews(); the view is its own renderer and hands the
 * geometry to the primitive's draw function on every repaint.
 */
template <typename Geometry>
class GeometryPaneView final : public IPaneView, private IPaneRenderer {
public:
    using DrawFn = std::function<void(const Geometry&, BitmapScope&)>;

    explicit GeometryPaneView(DrawFn draw) : m_draw(std::move(draw)) {}

    IPaneRenderer* renderer() override { return this; }

    Geometry& geometry() { return m_geometry; }
    const Geometry& geometry() const { return m_geometry; }

private:
    void draw(BitmapScope& scope) override {
        if (scope.painter && m_draw) m_draw(m_geometry, scope);
    }

    Geometry m_geometry;
    DrawFn m_draw;
};

} // namespace vantage
