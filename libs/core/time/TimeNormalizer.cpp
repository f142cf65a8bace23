#include "TimeNormalizer.hpp"
#include "../ParseUtils.hpp"

#include <chrono>
#include <cmath>

namespace vantage {

namespace {

bool isDigit(char ch) { return ch >= '0' && ch <= '9'; }

std::optional<int> fixedInt(std::string_view text, size_t pos, size_t len) {
    if (pos + len > text.size()) return std::nullopt;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!isDigit(text[i])) return std::nullopt;
    }
    return ParseUtils::parseInt(text.substr(pos, len));
}

bool looksNumeric(std::string_view text) {
    if (text.empty()) return false;
    size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    bool digits = false;
    for (; i < text.size(); ++i) {
        if (isDigit(text[i])) { digits = true; continue; }
        if (text[i] == '.') continue;
        return false;
    }
    return digits;
}

} // namespace

std::optional<UnixTime> TimeNormalizer::fromNumber(double value) {
    if (value > static_cast<double>(kMillisecondThreshold)) {
        return ParseUtils::toIntegral<UnixTime>(std::floor(value / 1000.0));
    }
    return ParseUtils::toIntegral<UnixTime>(std::floor(value));
}

std::optional<UnixTime> TimeNormalizer::normalize(const Json& value) {
    if (value.is_number()) {
        return fromNumber(value.get<double>());
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (looksNumeric(text)) {
            if (auto v = ParseUtils::parseDouble(text)) return fromNumber(*v);
            return std::nullopt;
        }
        return parseISO8601(text);
    }
    if (value.is_object() && value.contains("year") && value.contains("month") && value.contains("day")) {
        const auto y = ParseUtils::jsonNumber(value["year"]);
        const auto m = ParseUtils::jsonNumber(value["month"]);
        const auto d = ParseUtils::jsonNumber(value["day"]);
        if (!y || !m || !d || *m < 1 || *m > 12 || *d < 1 || *d > 31) return std::nullopt;
        const auto year = ParseUtils::toIntegral<int>(*y);
        if (!year) return std::nullopt;
        return fromBusinessDay(*year, static_cast<unsigned>(*m), static_cast<unsigned>(*d));
    }
    return std::nullopt;
}

std::optional<UnixTime> TimeNormalizer::fromBusinessDay(int yearValue, unsigned monthValue, unsigned dayValue) {
    using namespace std::chrono;
    const year_month_day ymd{year{yearValue}, month{monthValue}, day{dayValue}};
    if (!ymd.ok()) return std::nullopt;
    return sys_seconds{sys_days{ymd}}.time_since_epoch().count();
}

std::optional<UnixTime> TimeNormalizer::parseISO8601(std::string_view text) {
    // YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z|±HH[:MM]]
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    const auto yearValue = fixedInt(text, 0, 4);
    const auto monthValue = fixedInt(text, 5, 2);
    const auto dayValue = fixedInt(text, 8, 2);
    if (!yearValue || !monthValue || !dayValue || *monthValue < 1 || *dayValue < 1) return std::nullopt;

    auto days = fromBusinessDay(*yearValue, static_cast<unsigned>(*monthValue), static_cast<unsigned>(*dayValue));
    if (!days) return std::nullopt;

    std::int64_t seconds = *days;
    size_t pos = 10;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        const auto hourValue = fixedInt(text, pos, 2);
        if (!hourValue || pos + 2 >= text.size() || text[pos + 2] != ':') return std::nullopt;
        const auto minuteValue = fixedInt(text, pos + 3, 2);
        if (!minuteValue || *hourValue > 23 || *minuteValue > 59) return std::nullopt;
        seconds += *hourValue * 3600 + *minuteValue * 60;
        pos += 5;

        if (pos < text.size() && text[pos] == ':') {
            const auto secondValue = fixedInt(text, pos + 1, 2);
            if (!secondValue || *secondValue > 60) return std::nullopt;
            seconds += *secondValue;
            pos += 3;
        }

        // Fractional seconds do not survive integer normalization; skip them
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && isDigit(text[pos])) ++pos;
        }

        if (pos < text.size()) {
            const char tzChar = text[pos];
            if (tzChar == 'Z' || tzChar == 'z') {
                ++pos;
            } else if (tzChar == '+' || tzChar == '-') {
                const int tzSign = (tzChar == '+') ? 1 : -1;
                const auto tzHours = fixedInt(text, pos + 1, 2);
                if (!tzHours) return std::nullopt;
                pos += 3;
                int tzMinutes = 0;
                if (pos < text.size() && text[pos] == ':') ++pos;
                if (auto m = fixedInt(text, pos, 2)) {
                    tzMinutes = *m;
                    pos += 2;
                }
                seconds -= tzSign * (*tzHours * 3600 + tzMinutes * 60);
            }
        }
    }

    if (pos != text.size()) return std::nullopt;
    return seconds;
}

std::optional<UnixTime> TimeNormalizer::pointTime(const Json& point) {
    if (!point.is_object()) return std::nullopt;
    for (const char* key : {"time", "timestamp", "t"}) {
        auto it = point.find(key);
        if (it != point.end() && !it->is_null()) {
            return normalize(*it);
        }
    }
    return std::nullopt;
}

} // namespace vantage
