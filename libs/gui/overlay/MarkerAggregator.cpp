#include "MarkerAggregator.hpp"
#include "OverlayDefaults.hpp"
#include "../render/ColorParser.hpp"
#include "../../core/VantageLogging.hpp"

#include <algorithm>

namespace vantage {

MarkerAggregator::MarkerAggregator(LayerFactory factory)
    : m_factory(std::move(factory))
{}

void MarkerAggregator::setLayerFactory(LayerFactory factory) {
    m_layer.reset();
    m_factory = std::move(factory);
    publish();
}

MarkerPosition MarkerAggregator::mapPosition(std::string_view position) {
    if (position == "above" || position == "aboveBar") return MarkerPosition::AboveBar;
    if (position == "below" || position == "belowBar") return MarkerPosition::BelowBar;
    return MarkerPosition::InBar;
}

MarkerShape MarkerAggregator::mapShape(std::string_view shape, std::string_view position) {
    if (shape == "square") return MarkerShape::Square;
    if (shape == "triangle" || shape == "arrow") {
        return mapPosition(position) == MarkerPosition::AboveBar ? MarkerShape::ArrowDown : MarkerShape::ArrowUp;
    }
    return MarkerShape::Circle;
}

HostMarker MarkerAggregator::toHostMarker(const MarkerSpec& spec) {
    HostMarker marker;
    marker.time = spec.time;
    marker.position = mapPosition(spec.position);
    marker.shape = mapShape(spec.shape, spec.position);
    marker.color = ColorParser::parseOr(spec.color, OverlayDefaults::markerColor());
    marker.text = QString::fromStdString(spec.text);
    marker.size = spec.size > 0.0 ? spec.size : 1.0;
    return marker;
}

bool MarkerAggregator::setMarkers(const std::string& name, const std::vector<MarkerSpec>& markers) {
    if (markers.empty()) return false;

    std::vector<HostMarker> converted;
    converted.reserve(markers.size());
    for (const auto& spec : markers) {
        converted.push_back(toHostMarker(spec));
    }
    std::stable_sort(converted.begin(), converted.end(),
                     [](const HostMarker& a, const HostMarker& b) { return a.time < b.time; });

    m_sets[name] = std::move(converted);
    publish();
    return true;
}

bool MarkerAggregator::removeMarkers(const std::string& name) {
    if (m_sets.erase(name) == 0) return false;
    publish();
    return true;
}

void MarkerAggregator::clear() {
    if (m_sets.empty()) return;
    m_sets.clear();
    publish();
}

std::vector<std::string> MarkerAggregator::setNames() const {
    std::vector<std::string> names;
    names.reserve(m_sets.size());
    for (const auto& [name, markers] : m_sets) {
        names.push_back(name);
    }
    return names;
}

void MarkerAggregator::publish() {
    m_union.clear();
    for (const auto& [name, markers] : m_sets) {
        m_union.insert(m_union.end(), markers.begin(), markers.end());
    }
    std::stable_sort(m_union.begin(), m_union.end(),
                     [](const HostMarker& a, const HostMarker& b) { return a.time < b.time; });

    if (!m_layer) {
        if (m_union.empty() || !m_factory) return;
        m_layer = m_factory();
        if (!m_layer) {
            vLog_Warning("Marker layer unavailable," << m_union.size() << "markers not shown");
            return;
        }
    }

    vLog_Data("Publishing" << m_union.size() << "markers from" << m_sets.size() << "sets");
    m_layer->setMarkers(m_union);
}

} // namespace vantage
