/*
Vantage — MarkerAggregator
Role: Multiplexes independent marker sets (indicator signals, strategy entries, shape markers)
  into the single marker layer the host gives each series.
Inputs/Outputs: Named MarkerSpec lists in; one time-sorted HostMarker array out per change.
Threading: GUI thread.
Performance: The union is rebuilt and re-sorted on every change; sets are small (signals, not bars).
Integration: Owned by SeriesOverlayRegistry. The host layer is created lazily through the injected
  factory the first time the union is non-empty.
Observability: vLog_Data per publish.
Related: MarkerAggregator.cpp, ChartHost.hpp (IMarkerLayer), SeriesOverlayRegistry.hpp.
Assumptions: Marker times are already normalized.
*/
#pragma once
#include "../host/ChartHost.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vantage {

class MarkerAggregator {
public:
    using LayerFactory = std::function<std::unique_ptr<IMarkerLayer>()>;

    explicit MarkerAggregator(LayerFactory factory = {});

    // Replaces the factory and drops the current layer (main series changed)
    void setLayerFactory(LayerFactory factory);

    // Register or replace a set; an empty list is rejected
    bool setMarkers(const std::string& name, const std::vector<MarkerSpec>& markers);
    bool removeMarkers(const std::string& name);
    void clear();

    bool hasSet(const std::string& name) const { return m_sets.count(name) > 0; }
    std::vector<std::string> setNames() const;
    const std::vector<HostMarker>& visibleMarkers() const { return m_union; }

    static HostMarker toHostMarker(const MarkerSpec& spec);
    static MarkerPosition mapPosition(std::string_view position);
    static MarkerShape mapShape(std::string_view shape, std::string_view position);

private:
    void publish();

    LayerFactory m_factory;
    std::unique_ptr<IMarkerLayer> m_layer;
    std::map<std::string, std::vector<HostMarker>> m_sets;
    std::vector<HostMarker> m_union;
};

} // namespace vantage
