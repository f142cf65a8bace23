#pragma once

// Number and string helpers shared by the ingest paths.
// Upstream producers send numbers either as JSON numbers or as numeric strings,
// so every numeric read in the overlay pipeline goes through jsonNumber().

#include "VantageJson.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace vantage::ParseUtils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * Leading-number parse with strtod semantics ("12.5abc" -> 12.5).
 * @return nullopt when no digits were consumed or the result is not finite
 */
inline std::optional<double> parseDouble(std::string_view str) {
    if (str.empty()) return std::nullopt;
    const std::string owned(str);  // strtod needs a terminated buffer
    const char* begin = owned.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value)) return std::nullopt;
    return value;
}

/**
 * Double to signed integer, truncating toward zero.
 * @return nullopt for NaN, infinities and values outside Int's range
 */
template <typename Int>
inline std::optional<Int> toIntegral(double value) {
    static_assert(std::is_signed_v<Int>, "signed target only");
    // -2^(N-1) is exact in a double, so [lo, -lo) is the representable range
    constexpr double lo = static_cast<double>(std::numeric_limits<Int>::min());
    if (!std::isfinite(value) || value < lo || value >= -lo) return std::nullopt;
    return static_cast<Int>(value);
}

inline std::optional<int> parseInt(std::string_view str) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

/**
 * Numeric read of a JSON node: numbers, or strings holding a number.
 * Booleans, nulls, objects and arrays do not convert.
 */
inline std::optional<double> jsonNumber(const Json& node) {
    if (node.is_number()) {
        const double v = node.get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }
    if (node.is_string()) {
        return parseDouble(node.get_ref<const std::string&>());
    }
    return std::nullopt;
}

// Optional member read: missing key and non-numeric value are both "absent"
inline std::optional<double> jsonNumber(const Json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    return jsonNumber(*it);
}

inline std::string jsonString(const Json& obj, const char* key, std::string fallback = {}) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) return fallback;
    return it->get<std::string>();
}

// Present, not null, and (for numbers) non-zero: the truthiness test upstream
// configs rely on for "use default unless set"
inline bool jsonTruthy(const Json& obj, const char* key) {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) return !it->get_ref<const std::string&>().empty();
    return true;
}

} // namespace vantage::ParseUtils
