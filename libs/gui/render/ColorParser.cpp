#include "ColorParser.hpp"
#include "../../core/ParseUtils.hpp"

#include <QString>
#include <algorithm>
#include <string>
#include <vector>

namespace vantage::ColorParser {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<QColor> parseFunctional(std::string_view css, bool hasAlpha) {
    const auto open = css.find('(');
    const auto close = css.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close <= open) {
        return std::nullopt;
    }

    std::vector<double> parts;
    std::string_view body = css.substr(open + 1, close - open - 1);
    while (!body.empty()) {
        const auto comma = body.find(',');
        const auto token = trim(body.substr(0, comma));
        auto value = ParseUtils::parseDouble(token);
        if (!value) return std::nullopt;
        parts.push_back(*value);
        if (comma == std::string_view::npos) break;
        body.remove_prefix(comma + 1);
    }

    if (parts.size() != (hasAlpha ? 4u : 3u)) return std::nullopt;

    auto channel = [](double v) { return std::clamp(static_cast<int>(v + 0.5), 0, 255); };
    QColor color(channel(parts[0]), channel(parts[1]), channel(parts[2]));
    if (hasAlpha) color.setAlphaF(static_cast<float>(std::clamp(parts[3], 0.0, 1.0)));
    return color;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = ParseUtils::asciiToLower(static_cast<unsigned char>(c));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

// #rrggbbaa is RGBA in CSS; QColor reads 8 digits as ARGB, so handle it here
std::optional<QColor> parseHexRgba(std::string_view css) {
    int values[4];
    for (int i = 0; i < 4; ++i) {
        const int hi = hexDigit(css[1 + i * 2]);
        const int lo = hexDigit(css[2 + i * 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        values[i] = hi * 16 + lo;
    }
    return QColor(values[0], values[1], values[2], values[3]);
}

} // namespace

std::optional<QColor> parse(std::string_view css) {
    css = trim(css);
    if (css.empty()) return std::nullopt;

    if (ParseUtils::startsWith(css, "rgba(")) return parseFunctional(css, true);
    if (ParseUtils::startsWith(css, "rgb(")) return parseFunctional(css, false);
    if (css.front() == '#' && css.size() == 9) return parseHexRgba(css);

    const QColor color(QString::fromUtf8(css.data(), static_cast<qsizetype>(css.size())));
    if (!color.isValid()) return std::nullopt;
    return color;
}

QColor parseOr(std::string_view css, const QColor& fallback) {
    return parse(css).value_or(fallback);
}

} // namespace vantage::ColorParser
