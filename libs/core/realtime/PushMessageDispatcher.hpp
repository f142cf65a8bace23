#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "../VantageJson.hpp"

#include "ContextSubscription.hpp"
#include "../ParseUtils.hpp"
#include "../model/OverlayTypes.hpp"
#include "../time/TimeNormalizer.hpp"

namespace vantage {

// Context fields a push message may carry; absent fields match anything
struct TickContext {
    std::string provider;
    std::string symbol;
    std::string interval;

    bool matches(const ChartContext& active) const {
        return (provider.empty() || provider == active.provider)
            && (symbol.empty() || symbol == active.symbol)
            && (interval.empty() || interval == active.interval);
    }
};

struct ConnectedEvent { std::string message; };
struct ContextSubscribedEvent { int activeInstances = 0; };
struct CandleTickEvent { SeriesPoint candle; bool closed = false; TickContext context; };
struct IndicatorTickEvent {
    std::string instanceKey;
    std::string indicatorId;
    UnixTime time = 0;
    std::vector<std::pair<std::string, double>> values;  // field -> value
    TickContext context;
};
struct PushErrorEvent { std::string message; };
struct UnknownPushEvent { std::string type; };

using PushEvent = std::variant<ConnectedEvent, ContextSubscribedEvent, CandleTickEvent,
                               IndicatorTickEvent, PushErrorEvent, UnknownPushEvent>;

struct PushDispatchResult { std::vector<PushEvent> events; };

class PushMessageDispatcher {
public:
    static PushDispatchResult parse(const Json& j) {
        PushDispatchResult out;
        if (!j.is_object()) return out;

        const std::string type = ParseUtils::jsonString(j, "type");

        if (type == "connected") {
            out.events.emplace_back(ConnectedEvent{ParseUtils::jsonString(j, "message", "Connected")});
        } else if (type == "contextSubscribed") {
            // A count that does not fit an int is a malformed frame, not a huge subscription
            const auto active = ParseUtils::jsonNumber(j, "activeInstances");
            const auto count = active ? ParseUtils::toIntegral<int>(*active) : std::optional<int>(0);
            if (count) out.events.emplace_back(ContextSubscribedEvent{*count});
        } else if (type == "candleUpdate") {
            if (auto candle = parseCandle(j)) out.events.emplace_back(std::move(*candle));
        } else if (type == "indicatorUpdate") {
            if (auto tick = parseIndicator(j)) out.events.emplace_back(std::move(*tick));
        } else if (type == "error") {
            std::string message = "push channel error";
            if (j.contains("error")) {
                message = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
            }
            out.events.emplace_back(PushErrorEvent{std::move(message)});
        } else {
            out.events.emplace_back(UnknownPushEvent{type});
        }
        return out;
    }

private:
    static TickContext contextOf(const Json& message, const Json& body) {
        TickContext ctx;
        for (const auto* src : {&body, &message}) {
            if (ctx.provider.empty()) ctx.provider = ParseUtils::jsonString(*src, "provider");
            if (ctx.symbol.empty()) ctx.symbol = ParseUtils::jsonString(*src, "symbol");
            if (ctx.interval.empty()) ctx.interval = ParseUtils::jsonString(*src, "interval");
        }
        return ctx;
    }

    // Candle in message.candle, message.data.candle or message.data
    static std::optional<CandleTickEvent> parseCandle(const Json& j) {
        const Json* body = nullptr;
        if (j.contains("candle") && j["candle"].is_object()) {
            body = &j["candle"];
        } else if (j.contains("data") && j["data"].is_object()) {
            const auto& data = j["data"];
            body = (data.contains("candle") && data["candle"].is_object()) ? &data["candle"] : &data;
        }
        if (!body) return std::nullopt;

        auto time = TimeNormalizer::pointTime(*body);
        const auto open = ParseUtils::jsonNumber(*body, "open");
        const auto high = ParseUtils::jsonNumber(*body, "high");
        const auto low = ParseUtils::jsonNumber(*body, "low");
        const auto close = ParseUtils::jsonNumber(*body, "close");
        if (!time || !open || !high || !low || !close) return std::nullopt;

        CandleTickEvent ev;
        ev.candle.time = *time;
        ev.candle.value = *close;
        ev.candle.ohlc = OhlcValue{*open, *high, *low, *close};
        ev.closed = ParseUtils::jsonTruthy(*body, "closed");
        ev.context = contextOf(j, *body);
        return ev;
    }

    static std::optional<IndicatorTickEvent> parseIndicator(const Json& j) {
        const Json& body = (j.contains("data") && j["data"].is_object()) ? j["data"] : j;
        if (!body.contains("values") || !body["values"].is_object()) return std::nullopt;

        auto time = TimeNormalizer::pointTime(body);
        if (!time) return std::nullopt;

        IndicatorTickEvent ev;
        ev.instanceKey = ParseUtils::jsonString(body, "instanceKey");
        ev.indicatorId = ParseUtils::jsonString(body, "indicatorId");
        ev.time = *time;
        for (auto it = body["values"].begin(); it != body["values"].end(); ++it) {
            if (auto v = ParseUtils::jsonNumber(it.value())) {
                ev.values.emplace_back(it.key(), *v);
            }
        }
        ev.context = contextOf(j, body);
        return ev;
    }
};

} // namespace vantage
