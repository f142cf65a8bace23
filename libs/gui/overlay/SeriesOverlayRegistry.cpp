#include "SeriesOverlayRegistry.hpp"
#include "../render/ColorParser.hpp"
#include "../../core/ParseUtils.hpp"
#include "../../core/VantageLogging.hpp"
#include "../../core/model/ShapeParser.hpp"
#include "../../core/series/SeriesTransform.hpp"

#include <QString>
#include <algorithm>
#include <cctype>
#include <exception>

namespace vantage {

namespace {

const Json& nullJson() {
    static const Json null;
    return null;
}

const Json& emptyArray() {
    static const Json empty = Json::array();
    return empty;
}

// The first array of a {key: points} map, in producer order
const Json& firstSeriesArray(const Json& seriesMap) {
    if (!seriesMap.is_object() || seriesMap.empty()) return emptyArray();
    const auto& first = *seriesMap.begin();
    return first.is_array() ? first : emptyArray();
}

const Json& memberOr(const Json& obj, const char* key, const Json& fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    return it == obj.end() ? fallback : *it;
}

QString upperCased(const std::string& id) {
    std::string out(id);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return QString::fromStdString(out);
}

QColor withAlpha(QColor color, int alpha) {
    color.setAlpha(alpha);
    return color;
}

template <typename Shape>
std::vector<ShapeDescriptor> toDescriptors(const std::vector<Shape>& shapes) {
    return std::vector<ShapeDescriptor>(shapes.begin(), shapes.end());
}

} // namespace

SeriesOverlayRegistry::SeriesOverlayRegistry(IChartHost* host, AttachSchedulerConfig schedulerConfig, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_scheduler(new AttachScheduler(host, schedulerConfig, this))
{}

SeriesOverlayRegistry::~SeriesOverlayRegistry() {
    m_scheduler->cancelAll();
    for (auto& shape : m_shapes) release(shape.slot);
    for (auto& [id, fill] : m_fills) release(fill.slot);
}

void SeriesOverlayRegistry::setMainSeries(ISeriesApi* series) {
    if (series == m_main) return;

    if (m_main && (!m_shapes.empty() || !m_fills.empty())) {
        vLog_App("Main series changed, dropping" << m_shapes.size() << "shape primitives and"
                 << m_fills.size() << "fills");
        m_scheduler->cancelAll();
        for (auto& shape : m_shapes) release(shape.slot);
        m_shapes.clear();
        removeAllFillBetween();
    }

    m_main = series;
    if (m_main && m_host) {
        IChartHost* host = m_host;
        ISeriesApi* main = m_main;
        m_markers.setLayerFactory([host, main]() { return host->createMarkerLayer(main); });
    } else {
        m_markers.setLayerFactory({});
    }
}

// =============================================================================
// SERIES
// =============================================================================

SeriesOptions SeriesOverlayRegistry::buildOptions(const std::string& id, const SeriesDescriptor& descriptor,
                                                  const std::string& color, int lineWidth) const {
    const Json& config = descriptor.config;

    SeriesOptions options;
    options.color = ColorParser::parseOr(color, OverlayDefaults::seriesColor());
    options.lineWidth = lineWidth;
    if (auto style = ParseUtils::jsonNumber(config, "lineStyle")) {
        options.lineStyle = lineStyleFromNumber(static_cast<int>(*style));
    }

    const std::string title = ParseUtils::jsonString(config, "title", descriptor.displayName);
    options.title = title.empty() ? upperCased(id) : QString::fromStdString(title);

    switch (descriptor.kind) {
        case SeriesKind::Histogram:
            if (descriptor.separatePane) {
                options.priceScaleId = QString::fromStdString(id);
                options.scaleMarginTop = OverlayDefaults::kSeparatePaneMarginTop;
                options.scaleMarginBottom = OverlayDefaults::kSeparatePaneMarginBottom;
            }
            break;
        case SeriesKind::Area:
            options.priceLineVisible = false;
            options.color = ColorParser::parseOr(ParseUtils::jsonString(config, "lineColor"), options.color);
            options.topColor = ColorParser::parseOr(ParseUtils::jsonString(config, "topColor"),
                                                    withAlpha(options.color, OverlayDefaults::kAreaTopAlpha));
            options.bottomColor = ColorParser::parseOr(ParseUtils::jsonString(config, "bottomColor"),
                                                       withAlpha(options.color, 0));
            break;
        case SeriesKind::Baseline: {
            const Json& base = memberOr(config, "baseValue", nullJson());
            if (auto price = base.is_object() ? ParseUtils::jsonNumber(base, "price") : ParseUtils::jsonNumber(base)) {
                options.baseValue = *price;
            }
            options.color = ColorParser::parseOr(ParseUtils::jsonString(config, "lineColor"), options.color);
            options.topLineColor = ColorParser::parseOr(ParseUtils::jsonString(config, "topFillColor1"),
                                                        withAlpha(options.color, OverlayDefaults::kBaselineFillAlpha));
            options.bottomLineColor = ColorParser::parseOr(ParseUtils::jsonString(config, "bottomFillColor1"),
                                                           withAlpha(options.color, OverlayDefaults::kBaselineFillAlpha));
            break;
        }
        case SeriesKind::Bar:
            options.upColor = ColorParser::parseOr(ParseUtils::jsonString(config, "upColor"), options.color);
            options.downColor = ColorParser::parseOr(ParseUtils::jsonString(config, "downColor"), options.color);
            break;
        case SeriesKind::Candlestick:
            options.upColor = ColorParser::parseOr(ParseUtils::jsonString(config, "upColor"),
                                                   OverlayDefaults::candleUpColor());
            options.downColor = ColorParser::parseOr(ParseUtils::jsonString(config, "downColor"),
                                                     OverlayDefaults::candleDownColor());
            break;
        case SeriesKind::Line:
        case SeriesKind::Marker:
            break;
    }

    if (auto it = config.find("priceLineVisible"); it != config.end() && it->is_boolean()) {
        options.priceLineVisible = it->get<bool>();
    }
    if (auto it = config.find("lastValueVisible"); it != config.end() && it->is_boolean()) {
        options.lastValueVisible = it->get<bool>();
    }
    return options;
}

bool SeriesOverlayRegistry::addSeries(const std::string& id, const Json& points,
                                      const SeriesDescriptor& descriptor, const Json& params) {
    if (!m_host) {
        vLog_Warning("Cannot add series" << QString::fromStdString(id) << ": no chart host");
        return false;
    }
    if (hasSeries(id)) {
        vLog_Warning("Series already registered:" << QString::fromStdString(id));
        return false;
    }
    if (!points.is_array() || points.empty()) {
        vLog_Warning("No data provided for series:" << QString::fromStdString(id));
        return false;
    }

    if (descriptor.kind == SeriesKind::Marker) {
        return addMarkerSeries(id, points, descriptor, params);
    }

    const Json& config = descriptor.config;
    const std::string color = ParseUtils::jsonString(config, "color",
                                  ParseUtils::jsonString(params, "color", SeriesTransform::kDefaultColor));
    int lineWidth = OverlayDefaults::kLineWidth;
    if (auto w = ParseUtils::jsonNumber(config, "lineWidth"); w && *w != 0.0) lineWidth = static_cast<int>(*w);
    else if (auto pw = ParseUtils::jsonNumber(params, "lineWidth"); pw && *pw != 0.0) lineWidth = static_cast<int>(*pw);

    ISeriesApi* series = m_host->addSeries(descriptor.kind, buildOptions(id, descriptor, color, lineWidth));
    if (!series) {
        vLog_Error("Failed to create host series for" << QString::fromStdString(id));
        return false;
    }

    std::vector<SeriesPoint> transformed = SeriesTransform::apply(points, id, descriptor.kind, color);
    if (transformed.empty()) {
        vLog_Warning("No valid data points for series:" << QString::fromStdString(id));
        m_host->removeSeries(series);
        return false;
    }

    const size_t count = transformed.size();
    series->setData(std::move(transformed));

    OverlayEntry entry;
    entry.kind = descriptor.kind;
    entry.series = series;
    entry.descriptor = descriptor;
    entry.params = params;
    entry.color = color;
    m_entries.emplace(id, std::move(entry));

    vLog_App("Added series" << QString::fromStdString(id) << toString(descriptor.kind) << "with" << count << "points");
    notifyChanged();
    return true;
}

bool SeriesOverlayRegistry::addMarkerSeries(const std::string& id, const Json& points,
                                            const SeriesDescriptor& descriptor, const Json& params) {
    const MarkerSeriesConfig config = MarkerSeriesConfig::fromJson(descriptor.config, params);
    std::vector<MarkerSpec> markers = SeriesTransform::buildMarkers(points, config);

    vLog_Data("Marker series" << QString::fromStdString(id) << ":" << markers.size() << "of"
              << points.size() << "points matched");
    if (markers.empty()) {
        vLog_Warning("No markers generated for series:" << QString::fromStdString(id)
                     << "(no point matched" << QString::fromStdString(config.conditionField) << ")");
        return false;
    }
    if (!addShapeMarkers(id, markers)) return false;

    // Re-derivation on update replaces the tracked entry
    OverlayEntry entry;
    entry.kind = SeriesKind::Marker;
    entry.descriptor = descriptor;
    entry.params = params;
    entry.color = config.color;
    m_entries[id] = std::move(entry);
    notifyChanged();
    return true;
}

bool SeriesOverlayRegistry::updateSeries(const std::string& id, const Json& points) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        // A bare marker set registered through addShapeMarkers can be re-derived as a marker series
        if (m_markers.hasSet(id)) {
            SeriesDescriptor descriptor;
            descriptor.kind = SeriesKind::Marker;
            return addMarkerSeries(id, points, descriptor, Json::object());
        }
        vLog_Warning("Series not found for update:" << QString::fromStdString(id));
        return false;
    }

    OverlayEntry& entry = it->second;
    if (entry.kind == SeriesKind::Marker) {
        return addMarkerSeries(id, points, entry.descriptor, entry.params);
    }

    std::vector<SeriesPoint> transformed = SeriesTransform::apply(points, id, entry.kind, entry.color);
    if (transformed.empty()) {
        vLog_Warning("Update for" << QString::fromStdString(id) << "has no valid points");
        return false;
    }
    const size_t count = transformed.size();
    entry.series->setData(std::move(transformed));
    vLog_Data("Updated series" << QString::fromStdString(id) << "with" << count << "points");
    return true;
}

bool SeriesOverlayRegistry::removeSeries(const std::string& id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return false;

    if (it->second.kind == SeriesKind::Marker) {
        m_markers.removeMarkers(id);
    } else if (m_host && it->second.series) {
        m_host->removeSeries(it->second.series);
    }
    m_entries.erase(it);

    vLog_App("Removed series" << QString::fromStdString(id));
    notifyChanged();
    return true;
}

int SeriesOverlayRegistry::removeSeriesByPrefix(const std::string& prefix) {
    ChangeBatch batch(*this);
    std::vector<std::string> matching;
    for (const auto& [id, entry] : m_entries) {
        if (ParseUtils::startsWith(id, prefix)) matching.push_back(id);
    }
    int removed = 0;
    for (const auto& id : matching) {
        if (removeSeries(id)) ++removed;
    }
    vLog_App("Removed" << removed << "series with prefix" << QString::fromStdString(prefix));
    return removed;
}

void SeriesOverlayRegistry::clearAll() {
    for (auto& [id, entry] : m_entries) {
        if (entry.kind == SeriesKind::Marker) {
            m_markers.removeMarkers(id);
        } else if (m_host && entry.series) {
            m_host->removeSeries(entry.series);
        }
    }
    const size_t count = m_entries.size();
    m_entries.clear();
    vLog_App("Cleared" << count << "series");
    notifyChanged();
}

std::vector<std::string> SeriesOverlayRegistry::getAllSeriesIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, entry] : m_entries) ids.push_back(id);
    return ids;
}

ISeriesApi* SeriesOverlayRegistry::seriesHandle(const std::string& id) const {
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : it->second.series;
}

std::optional<SeriesKind> SeriesOverlayRegistry::seriesKind(const std::string& id) const {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.kind;
}

// =============================================================================
// API RESPONSES
// =============================================================================

ApiIngestResult SeriesOverlayRegistry::addFromApiResponse(const std::string& id, const Json& response,
                                                          const Json& extraParams) {
    ChangeBatch batch(*this);
    ApiIngestResult result;
    if (!response.is_object()) {
        vLog_Warning("API response for" << QString::fromStdString(id) << "is not an object");
        return result;
    }

    try {
        const Json& metadata = memberOr(response, "metadata", nullJson());
        const Json& seriesMap = memberOr(response, "series", nullJson());
        const bool hasMetadata = metadata.is_object() && !metadata.empty();

        vLog_Data("API response" << QString::fromStdString(id) << "metadata entries"
                  << (hasMetadata ? static_cast<int>(metadata.size()) : 0)
                  << "series arrays" << (seriesMap.is_object() ? static_cast<int>(seriesMap.size()) : 0));

        if (hasMetadata && metadata.size() > 1) {
            int added = 0;
            for (auto it = metadata.begin(); it != metadata.end(); ++it) {
                const std::string& subKey = it.key();
                const SeriesDescriptor descriptor = SeriesDescriptor::fromJson(it.value());

                Json data = Json::array();
                if (descriptor.kind == SeriesKind::Marker) {
                    // Marker streams need price and condition side by side
                    const std::string priceField = ParseUtils::jsonString(descriptor.config, "priceField");
                    const std::string conditionField = ParseUtils::jsonString(descriptor.config, "conditionField");
                    const Json& priceData = priceField.empty()
                        ? emptyArray() : memberOr(seriesMap, priceField.c_str(), emptyArray());
                    const Json& conditionData = conditionField.empty()
                        ? emptyArray() : memberOr(seriesMap, conditionField.c_str(), emptyArray());
                    if (priceData.is_array() && !priceData.empty() && conditionData.is_array() && !conditionData.empty()) {
                        data = SeriesTransform::joinByTime(priceData, conditionData, priceField, conditionField);
                        vLog_Data("Joined" << QString::fromStdString(priceField) << "and"
                                  << QString::fromStdString(conditionField) << "into" << data.size() << "points");
                    } else {
                        vLog_Warning("Marker series" << QString::fromStdString(subKey) << "needs both"
                                     << QString::fromStdString(priceField) << "and"
                                     << QString::fromStdString(conditionField) << "arrays");
                    }
                } else {
                    const Json& own = memberOr(seriesMap, subKey.c_str(), emptyArray());
                    data = (own.is_array() && !own.empty()) ? own : firstSeriesArray(seriesMap);
                }

                if (addSeries(id + "_" + subKey, data, descriptor, extraParams)) ++added;
            }
            result.seriesAdded = added > 0;
        } else if (hasMetadata) {
            // Descriptor by id, then by id without the indicator_ prefix, then the first entry
            auto usable = [](const Json& node) { return node.is_object() && !node.empty(); };
            const Json* meta = &memberOr(metadata, id.c_str(), nullJson());
            if (!usable(*meta) && ParseUtils::startsWith(id, "indicator_")) {
                meta = &memberOr(metadata, id.substr(10).c_str(), nullJson());
            }
            if (!usable(*meta)) meta = &*metadata.begin();

            result.seriesAdded = addSeries(id, firstSeriesArray(seriesMap), SeriesDescriptor::fromJson(*meta), extraParams);
        } else {
            result.seriesAdded = addSeries(id, firstSeriesArray(seriesMap), SeriesDescriptor{}, extraParams);
        }

        if (auto shapes = response.find("shapes"); shapes != response.end() && shapes->is_object()) {
            const ApiIngestResult shapeResult = addShapesFromApiResponse(id, *shapes, seriesMap);
            result.markers = shapeResult.markers;
            result.lines = shapeResult.lines;
            result.boxes = shapeResult.boxes;
            result.arrows = shapeResult.arrows;
            result.markerShapes = shapeResult.markerShapes;
            result.fills = shapeResult.fills;
        }
    } catch (const Json::exception& e) {
        vLog_Error("Malformed API response for" << QString::fromStdString(id) << ":" << e.what());
    }
    return result;
}

int SeriesOverlayRegistry::addStrategySeries(const std::string& strategyName, const Json& seriesData,
                                             const Json& configs) {
    if (!seriesData.is_object()) return 0;

    ChangeBatch batch(*this);
    const std::string prefix = "strategy_" + strategyName + "_";
    int added = 0;

    auto addOne = [&](const std::string& suffix, const Json& data, const Json& config,
                      SeriesKind kind) {
        SeriesDescriptor descriptor;
        descriptor.kind = kind;
        descriptor.config = config;
        if (addSeries(prefix + suffix, data, descriptor)) ++added;
    };

    auto configFor = [&configs](const char* key, Json fallback) {
        const Json& config = memberOr(configs, key, nullJson());
        return config.is_object() ? config : fallback;
    };

    auto kindFor = [&configs](const char* key) {
        const Json& config = memberOr(configs, key, nullJson());
        const std::string type = ParseUtils::jsonString(config, "type", "line");
        return seriesKindFromString(type).value_or(SeriesKind::Line);
    };

    if (auto it = seriesData.find("signals"); it != seriesData.end() && it->is_array()) {
        addOne("signals", *it, configFor("signals", OverlayDefaults::strategySignalsStyle()), kindFor("signals"));
    }
    if (auto it = seriesData.find("trendline"); it != seriesData.end() && it->is_array()) {
        addOne("trend", *it, configFor("trendline", OverlayDefaults::strategyTrendStyle()), SeriesKind::Line);
    }
    if (auto it = seriesData.find("levels"); it != seriesData.end() && it->is_array()) {
        addOne("levels", *it, configFor("levels", OverlayDefaults::strategyLevelsStyle()), SeriesKind::Line);
    }

    for (auto it = seriesData.begin(); it != seriesData.end(); ++it) {
        const std::string& key = it.key();
        if (key == "signals" || key == "trendline" || key == "levels") continue;
        if (!it->is_array() || it->empty()) continue;
        addOne(key, *it, configFor(key.c_str(), OverlayDefaults::strategyCustomStyle()), kindFor(key.c_str()));
    }

    vLog_App("Added" << added << "series for strategy" << QString::fromStdString(strategyName));
    return added;
}

int SeriesOverlayRegistry::removeStrategy(const std::string& strategyName) {
    return removeSeriesByPrefix("strategy_" + strategyName + "_");
}

// =============================================================================
// CHANGE NOTIFICATION
// =============================================================================

SeriesOverlayRegistry::ChangeBatch::ChangeBatch(SeriesOverlayRegistry& registry)
    : m_registry(registry)
{
    ++m_registry.m_batchDepth;
}

SeriesOverlayRegistry::ChangeBatch::~ChangeBatch() {
    if (--m_registry.m_batchDepth > 0 || !m_registry.m_changedInBatch) return;
    m_registry.m_changedInBatch = false;
    emit m_registry.overlaysChanged();
}

void SeriesOverlayRegistry::notifyChanged() {
    if (m_batchDepth > 0) {
        m_changedInBatch = true;
        return;
    }
    emit overlaysChanged();
}

// =============================================================================
// PRIMITIVE LIFECYCLE
// =============================================================================

bool SeriesOverlayRegistry::requireMainSeries(const char* operation) const {
    if (m_host && m_main) return true;
    vLog_Warning("Cannot" << operation << ": main series not set");
    return false;
}

quint64 SeriesOverlayRegistry::adopt(PrimitiveSlot& slot, std::unique_ptr<IPanePrimitive> primitive) {
    slot.serial = m_nextSerial++;
    slot.primitive = std::move(primitive);
    slot.attached = false;

    const quint64 serial = slot.serial;
    m_scheduler->schedule([this, serial]() { attachSlot(serial); });
    return serial;
}

void SeriesOverlayRegistry::attachSlot(quint64 serial) {
    PrimitiveSlot* target = nullptr;
    for (auto& shape : m_shapes) {
        if (shape.slot.serial == serial) target = &shape.slot;
    }
    for (auto& [id, fill] : m_fills) {
        if (fill.slot.serial == serial) target = &fill.slot;
    }
    // Removed before the deferred attach came due
    if (!target || target->attached || !m_host) return;

    m_host->attachPrimitive(target->primitive.get());
    target->attached = true;
    m_host->requestRepaint();
}

void SeriesOverlayRegistry::release(PrimitiveSlot& slot) {
    if (slot.attached && m_host && slot.primitive) {
        m_host->detachPrimitive(slot.primitive.get());
    }
    slot.attached = false;
    slot.primitive.reset();
}

void SeriesOverlayRegistry::removePrimitives(ShapeKind kind) {
    auto it = std::remove_if(m_shapes.begin(), m_shapes.end(), [this, kind](ShapeSlot& shape) {
        if (shape.kind != kind) return false;
        release(shape.slot);
        return true;
    });
    const auto removed = std::distance(it, m_shapes.end());
    m_shapes.erase(it, m_shapes.end());
    if (removed > 0) {
        vLog_App("Removed" << removed << toString(kind) << "primitives");
        if (m_host) m_host->requestRepaint();
    }
}

size_t SeriesOverlayRegistry::primitiveCount(ShapeKind kind) const {
    return static_cast<size_t>(std::count_if(m_shapes.begin(), m_shapes.end(),
                                             [kind](const ShapeSlot& shape) { return shape.kind == kind; }));
}

size_t SeriesOverlayRegistry::attachedPrimitiveCount() const {
    size_t count = 0;
    for (const auto& shape : m_shapes) count += shape.slot.attached ? 1 : 0;
    for (const auto& [id, fill] : m_fills) count += fill.slot.attached ? 1 : 0;
    return count;
}

// =============================================================================
// SHAPES
// =============================================================================

bool SeriesOverlayRegistry::addShapes(const std::vector<ShapeDescriptor>& shapes) {
    if (!requireMainSeries("add shapes")) return false;
    if (shapes.empty()) return false;

    std::vector<CreatedPrimitive> created = ShapePrimitiveFactory(*m_host, m_main).create(shapes);
    if (created.empty()) return false;

    for (auto& item : created) {
        vLog_App("Primitive with" << item.shapeCount << toString(item.kind) << "queued for attach");
        m_shapes.push_back(ShapeSlot{item.kind, PrimitiveSlot{}});
        adopt(m_shapes.back().slot, std::move(item.primitive));
    }
    return true;
}

bool SeriesOverlayRegistry::addBoxes(const std::vector<BoxShape>& boxes) { return addShapes(toDescriptors(boxes)); }
void SeriesOverlayRegistry::removeAllBoxes() { removePrimitives(ShapeKind::Box); }
bool SeriesOverlayRegistry::updateBoxes(const std::vector<BoxShape>& boxes) {
    removeAllBoxes();
    return addBoxes(boxes);
}

bool SeriesOverlayRegistry::addLines(const std::vector<LineShape>& lines) { return addShapes(toDescriptors(lines)); }
void SeriesOverlayRegistry::removeAllLines() { removePrimitives(ShapeKind::Line); }
bool SeriesOverlayRegistry::updateLines(const std::vector<LineShape>& lines) {
    removeAllLines();
    return addLines(lines);
}

bool SeriesOverlayRegistry::addArrows(const std::vector<ArrowShape>& arrows) { return addShapes(toDescriptors(arrows)); }
void SeriesOverlayRegistry::removeAllArrows() { removePrimitives(ShapeKind::Arrow); }
bool SeriesOverlayRegistry::updateArrows(const std::vector<ArrowShape>& arrows) {
    removeAllArrows();
    return addArrows(arrows);
}

bool SeriesOverlayRegistry::addMarkerShapes(const std::vector<MarkerGlyphShape>& glyphs) {
    return addShapes(toDescriptors(glyphs));
}
void SeriesOverlayRegistry::removeAllMarkerShapes() { removePrimitives(ShapeKind::MarkerGlyph); }
bool SeriesOverlayRegistry::updateMarkerShapes(const std::vector<MarkerGlyphShape>& glyphs) {
    removeAllMarkerShapes();
    return addMarkerShapes(glyphs);
}

// =============================================================================
// FILLS
// =============================================================================

bool SeriesOverlayRegistry::addFillBetween(const std::string& id, const FillRegion& region,
                                           ConditionalColor conditionalColor) {
    if (!requireMainSeries("add fill between")) return false;

    std::unique_ptr<FillBetweenPrimitive> fill =
        ShapePrimitiveFactory(*m_host, m_main).createFill(region, std::move(conditionalColor));
    if (!fill) return false;

    if (hasFill(id)) {
        vLog_App("Replacing fill" << QString::fromStdString(id));
        removeFillBetween(id);
    }

    FillSlot& slot = m_fills[id];
    slot.fill = fill.get();
    adopt(slot.slot, std::move(fill));

    vLog_App("Fill" << QString::fromStdString(id) << "queued for attach, mode"
             << (region.mode == FillMode::HLine ? "hline" : "series"));
    return true;
}

bool SeriesOverlayRegistry::removeFillBetween(const std::string& id) {
    auto it = m_fills.find(id);
    if (it == m_fills.end()) return false;
    release(it->second.slot);
    m_fills.erase(it);
    if (m_host) m_host->requestRepaint();
    return true;
}

bool SeriesOverlayRegistry::updateFillBetween(const std::string& id, const FillRegion& region) {
    auto it = m_fills.find(id);
    if (it == m_fills.end()) {
        vLog_Warning("Fill not found:" << QString::fromStdString(id));
        return false;
    }
    try {
        it->second.fill->updateOptions(region);
    } catch (const std::exception& e) {
        vLog_Error("Fill update rejected for" << QString::fromStdString(id) << ":" << e.what());
        return false;
    }
    if (m_host) m_host->requestRepaint();
    return true;
}

bool SeriesOverlayRegistry::updateFillSources(const std::string& id, FillSource source1, FillSource source2) {
    auto it = m_fills.find(id);
    if (it == m_fills.end()) {
        vLog_Warning("Fill not found:" << QString::fromStdString(id));
        return false;
    }
    try {
        it->second.fill->updateSourceData(std::move(source1), std::move(source2));
    } catch (const std::exception& e) {
        vLog_Error("Fill source update rejected for" << QString::fromStdString(id) << ":" << e.what());
        return false;
    }
    if (m_host) m_host->requestRepaint();
    return true;
}

void SeriesOverlayRegistry::removeAllFillBetween() {
    for (auto& [id, fill] : m_fills) release(fill.slot);
    m_fills.clear();
    if (m_host) m_host->requestRepaint();
}

std::vector<std::string> SeriesOverlayRegistry::fillIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_fills.size());
    for (const auto& [id, fill] : m_fills) ids.push_back(id);
    return ids;
}

// =============================================================================
// MARKERS
// =============================================================================

bool SeriesOverlayRegistry::addShapeMarkers(const std::string& id, const std::vector<MarkerSpec>& markers) {
    if (!requireMainSeries("add markers")) return false;
    if (!m_markers.setMarkers(id, markers)) return false;
    vLog_App("Marker set" << QString::fromStdString(id) << "with" << markers.size() << "markers");
    return true;
}

bool SeriesOverlayRegistry::removeShapeMarkers(const std::string& id) {
    return m_markers.removeMarkers(id);
}

void SeriesOverlayRegistry::removeAllShapeMarkers() {
    m_markers.clear();
}

// =============================================================================
// SHAPES FROM API
// =============================================================================

ApiIngestResult SeriesOverlayRegistry::addShapesFromApiResponse(const std::string& id, const Json& shapes,
                                                                const Json& seriesMap) {
    ApiIngestResult result;
    if (!shapes.is_object()) return result;

    // Each section stands alone: a malformed one never blocks the others
    auto section = [&](const char* key, auto&& ingest) {
        auto it = shapes.find(key);
        if (it == shapes.end() || it->is_null()) return;
        try {
            ingest(*it);
        } catch (const Json::exception& e) {
            vLog_Error("Shape section" << key << "of" << QString::fromStdString(id) << "rejected:" << e.what());
        }
    };

    section("markers", [&](const Json& node) {
        result.markers = addShapeMarkers(id + "_markers", ShapeParser::parseMarkerSpecs(node));
    });
    section("lines", [&](const Json& node) { result.lines = addLines(ShapeParser::parseLines(node)); });
    section("boxes", [&](const Json& node) { result.boxes = addBoxes(ShapeParser::parseBoxes(node)); });
    section("arrows", [&](const Json& node) { result.arrows = addArrows(ShapeParser::parseArrows(node)); });
    section("markerShapes", [&](const Json& node) {
        result.markerShapes = addMarkerShapes(ShapeParser::parseMarkerGlyphs(node));
    });

    auto addFillConfig = [&](const Json& config, size_t index) {
        const std::string fillId = "fill_" + id + "_" + std::to_string(index);
        auto region = ShapeParser::parseFillRegion(config, seriesMap);
        if (!region) {
            vLog_Warning("Fill" << QString::fromStdString(fillId) << "has unresolvable sources");
            return;
        }
        if (addFillBetween(fillId, *region)) ++result.fills;
    };

    section("fill", [&](const Json& node) {
        if (node.is_object() && ParseUtils::jsonTruthy(node, "enabled")) addFillConfig(node, 0);
    });
    section("fills", [&](const Json& node) {
        if (!node.is_array()) return;
        for (size_t i = 0; i < node.size(); ++i) {
            const auto& config = node[i];
            if (!config.is_object()) continue;
            if (auto enabled = config.find("enabled"); enabled != config.end() && enabled->is_boolean()
                && !enabled->get<bool>()) {
                continue;
            }
            addFillConfig(config, i);
        }
    });

    vLog_Data("Shapes for" << QString::fromStdString(id) << "markers" << result.markers << "lines" << result.lines
              << "boxes" << result.boxes << "arrows" << result.arrows << "glyphs" << result.markerShapes
              << "fills" << result.fills);
    return result;
}

void SeriesOverlayRegistry::removeShapes(const std::string& id) {
    removeShapeMarkers(id + "_markers");

    const std::string fillPrefix = "fill_" + id + "_";
    std::vector<std::string> fills;
    for (const auto& [fillId, fill] : m_fills) {
        if (ParseUtils::startsWith(fillId, fillPrefix)) fills.push_back(fillId);
    }
    for (const auto& fillId : fills) removeFillBetween(fillId);
}

void SeriesOverlayRegistry::clearAllShapes() {
    m_scheduler->cancelAll();
    removeAllShapeMarkers();
    removeAllLines();
    removeAllArrows();
    removeAllMarkerShapes();
    removeAllBoxes();
    removeAllFillBetween();
    vLog_App("Cleared all shapes");
}

} // namespace vantage
