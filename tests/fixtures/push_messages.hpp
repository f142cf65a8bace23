#pragma once
#include "VantageJson.hpp"
#include <string>
#include <utility>
#include <vector>

/// Push channel frames in the indicator server's wire format
namespace fixtures {

inline vantage::Json candleUpdate(long long time, double open, double high, double low, double close,
                                   bool closed = false,
                                   const std::string& provider = "binance",
                                   const std::string& symbol = "BTCUSDT",
                                   const std::string& interval = "1m") {
    return vantage::Json{
        {"type", "candleUpdate"},
        {"provider", provider},
        {"symbol", symbol},
        {"interval", interval},
        {"candle", {
            {"time", time},
            {"open", open},
            {"high", high},
            {"low", low},
            {"close", close},
            {"closed", closed}
        }}
    };
}

inline vantage::Json indicatorUpdate(const std::string& instanceKey,
                                      const std::string& indicatorId,
                                      long long time,
                                      const std::vector<std::pair<std::string, double>>& values,
                                      const std::string& symbol = "BTCUSDT") {
    vantage::Json valueObj = vantage::Json::object();
    for (const auto& [field, value] : values) {
        valueObj[field] = value;
    }
    return vantage::Json{
        {"type", "indicatorUpdate"},
        {"data", {
            {"instanceKey", instanceKey},
            {"indicatorId", indicatorId},
            {"provider", "binance"},
            {"symbol", symbol},
            {"interval", "1m"},
            {"time", time},
            {"values", valueObj}
        }}
    };
}

inline vantage::Json contextSubscribed(int activeInstances) {
    return vantage::Json{{"type", "contextSubscribed"}, {"activeInstances", activeInstances}};
}

inline vantage::Json pushError(const std::string& message) {
    return vantage::Json{{"type", "error"}, {"error", message}};
}

} // namespace fixtures
