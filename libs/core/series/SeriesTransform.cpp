#include "SeriesTransform.hpp"
#include "../ParseUtils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace vantage {

namespace {

void eraseFirst(std::string& text, std::string_view token) {
    const auto pos = text.find(token);
    if (pos != std::string::npos) text.erase(pos, token.size());
}

// Upstream configs treat 0, "" and null as "not set" when chaining fallbacks
bool isFalsy(const Json& node) {
    if (node.is_null()) return true;
    if (node.is_boolean()) return !node.get<bool>();
    if (node.is_number()) return node.get<double>() == 0.0;
    if (node.is_string()) return node.get_ref<const std::string&>().empty();
    return false;
}

const Json* findMember(const Json& obj, const std::string& key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

// point[field], then point.values[field], then point.fills[field]
const Json* fieldLookup(const Json& point, const std::string& field) {
    if (const auto* direct = findMember(point, field)) return direct;
    if (const auto* values = findMember(point, "values"); values && values->is_object()) {
        return findMember(*values, field);
    }
    if (const auto* fills = findMember(point, "fills"); fills && fills->is_object()) {
        return findMember(*fills, field);
    }
    return nullptr;
}

} // namespace

std::string SeriesTransform::baseIdFor(const std::string& seriesId) {
    std::string base = seriesId;
    eraseFirst(base, "indicator_");
    eraseFirst(base, "strategy_");
    return base;
}

std::optional<double> SeriesTransform::scalarValue(const Json& point,
                                                   const std::string& baseId,
                                                   const std::string& seriesId) {
    if (const auto* values = findMember(point, "values"); values && values->is_object()) {
        for (const std::string& key : {baseId, seriesId, std::string("value"), std::string("val")}) {
            if (const auto* v = findMember(*values, key); v && !isFalsy(*v)) {
                return ParseUtils::jsonNumber(*v);
            }
        }
        if (values->empty()) return std::nullopt;
        return ParseUtils::jsonNumber(values->begin().value());
    }

    for (const char* key : {"value", "val", "v"}) {
        if (const auto* v = findMember(point, key)) {
            return ParseUtils::jsonNumber(*v);
        }
    }
    return std::nullopt;
}

std::optional<SeriesPoint> SeriesTransform::transformPoint(const Json& point,
                                                           const std::string& seriesId,
                                                           SeriesKind kind,
                                                           const std::string& color) {
    if (!point.is_object()) return std::nullopt;

    auto time = TimeNormalizer::pointTime(point);
    if (!time) return std::nullopt;

    SeriesPoint out;
    out.time = *time;

    if (isOhlcKind(kind)) {
        const auto open = ParseUtils::jsonNumber(point, "open");
        const auto high = ParseUtils::jsonNumber(point, "high");
        const auto low = ParseUtils::jsonNumber(point, "low");
        const auto close = ParseUtils::jsonNumber(point, "close");
        if (!open || !high || !low || !close) return std::nullopt;
        out.ohlc = OhlcValue{*open, *high, *low, *close};
        out.value = *close;
        return out;
    }

    const auto value = scalarValue(point, baseIdFor(seriesId), seriesId);
    if (!value || *value == 0.0) return std::nullopt;
    out.value = *value;

    if (kind == SeriesKind::Histogram) {
        const std::string pointColor = ParseUtils::jsonString(point, "color");
        if (!pointColor.empty()) {
            out.color = pointColor;
        } else {
            out.color = *value >= 0.0 ? color : std::string(kNegativeHistogramColor);
        }
    }
    return out;
}

std::vector<SeriesPoint> SeriesTransform::dedupAndSort(std::vector<SeriesPoint> points) {
    // stable sort keeps input order inside equal times; the last one wins
    std::stable_sort(points.begin(), points.end(),
                     [](const SeriesPoint& a, const SeriesPoint& b) { return a.time < b.time; });

    std::vector<SeriesPoint> out;
    out.reserve(points.size());
    for (auto& p : points) {
        if (!out.empty() && out.back().time == p.time) {
            out.back() = std::move(p);
        } else {
            out.push_back(std::move(p));
        }
    }
    return out;
}

std::vector<SeriesPoint> SeriesTransform::apply(const Json& points,
                                                const std::string& seriesId,
                                                SeriesKind kind,
                                                const std::string& color) {
    std::vector<SeriesPoint> out;
    if (!points.is_array()) return out;

    out.reserve(points.size());
    for (const auto& raw : points) {
        if (auto p = transformPoint(raw, seriesId, kind, color)) {
            out.push_back(std::move(*p));
        }
    }
    return dedupAndSort(std::move(out));
}

Json SeriesTransform::joinByTime(const Json& array1,
                                           const Json& array2,
                                           const std::string& field1Name,
                                           const std::string& field2Name) {
    std::map<UnixTime, Json> byTime;

    auto absorb = [&byTime](const Json& array, const std::string& field) {
        if (!array.is_array()) return;
        for (const auto& point : array) {
            auto time = TimeNormalizer::pointTime(point);
            if (!time) continue;
            Json value;
            if (const auto* v = findMember(point, "value")) value = *v;
            else if (const auto* v2 = findMember(point, "val")) value = *v2;
            else continue;

            auto& merged = byTime[*time];
            merged["time"] = *time;
            merged[field] = std::move(value);
        }
    };

    absorb(array1, field1Name);
    absorb(array2, field2Name);

    Json joined = Json::array();
    for (auto& [time, merged] : byTime) {
        if (merged.contains(field1Name) && merged.contains(field2Name)) {
            joined.push_back(std::move(merged));
        }
    }
    return joined;
}

std::vector<MarkerSpec> SeriesTransform::buildMarkers(const Json& points,
                                                      const MarkerSeriesConfig& config) {
    std::vector<MarkerSpec> markers;
    if (!points.is_array()) return markers;

    for (const auto& point : points) {
        if (!point.is_object()) continue;
        auto time = TimeNormalizer::pointTime(point);
        if (!time) continue;

        if (config.hasCondition()) {
            const auto* actual = fieldLookup(point, config.conditionField);
            if (!actual || *actual != config.conditionValue) continue;
        }

        std::optional<double> price;
        if (const auto* p = fieldLookup(point, config.priceField)) {
            price = ParseUtils::jsonNumber(*p);
        } else if (const auto* v = findMember(point, "value"); v && !isFalsy(*v)) {
            price = ParseUtils::jsonNumber(*v);
        } else {
            price = ParseUtils::jsonNumber(point, "close");
        }
        if (!price) continue;

        MarkerSpec spec;
        spec.time = *time;
        spec.price = *price;
        spec.shape = config.shape;
        spec.color = config.color;
        spec.size = config.size;
        spec.position = config.position;
        spec.text = config.text;
        markers.push_back(std::move(spec));
    }
    return markers;
}

bool SeriesTransform::isStrictlyAscending(const std::vector<SeriesPoint>& points) {
    return std::adjacent_find(points.begin(), points.end(),
                              [](const SeriesPoint& a, const SeriesPoint& b) { return a.time >= b.time; })
           == points.end();
}

} // namespace vantage
