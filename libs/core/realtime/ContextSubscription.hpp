#pragma once
#include <string>
#include "../VantageJson.hpp"

namespace vantage {

// (provider, symbol, interval): the key every push subscription is made for
struct ChartContext {
    std::string provider;
    std::string symbol;
    std::string interval;

    bool valid() const { return !provider.empty() && !symbol.empty() && !interval.empty(); }
    std::string toString() const { return provider + ":" + symbol + ":" + interval; }

    bool operator==(const ChartContext& other) const {
        return provider == other.provider && symbol == other.symbol && interval == other.interval;
    }
    bool operator!=(const ChartContext& other) const { return !(*this == other); }
};

class ContextSubscription {
public:
    void setContext(ChartContext context) { m_context = std::move(context); }
    const ChartContext& context() const { return m_context; }

    std::string buildSubscribeMsg() const { return buildMsg("subscribeContext"); }
    std::string buildUnsubscribeMsg() const { return buildMsg("unsubscribeContext"); }

private:
    ChartContext m_context;

    std::string buildMsg(const char* action) const {
        if (!m_context.valid()) return {};
        Json msg;
        msg["action"] = action;
        msg["provider"] = m_context.provider;
        msg["symbol"] = m_context.symbol;
        msg["interval"] = m_context.interval;
        return msg.dump();
    }
};

} // namespace vantage
