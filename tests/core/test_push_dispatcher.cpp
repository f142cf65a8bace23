/*
Vantage — PushMessageDispatcher Tests
Role: Verify pure JSON → PushEvent parsing for every push channel message type
Testing Strategy: Golden JSON fixtures → assert event types and fields
Coverage: Candle and indicator ticks (all body layouts), context matching, subscription
  frames, errors, unknown and malformed input, endpoint configuration
*/
#include <gtest/gtest.h>
#include "realtime/PushMessageDispatcher.hpp"
#include "realtime/RouterConfig.hpp"
#include "fixtures/push_messages.hpp"

#include <cstdlib>

using namespace vantage;
using json = vantage::Json;

// =============================================================================
// Candles
// =============================================================================

TEST(PushMessageDispatcher, ParseCandleUpdate) {
    auto result = PushMessageDispatcher::parse(fixtures::candleUpdate(1700000000000LL, 10, 12, 9, 11, true));

    ASSERT_EQ(result.events.size(), 1);
    auto* tick = std::get_if<CandleTickEvent>(&result.events[0]);
    ASSERT_NE(tick, nullptr);
    EXPECT_EQ(tick->candle.time, 1700000000);
    ASSERT_TRUE(tick->candle.ohlc.has_value());
    EXPECT_DOUBLE_EQ(tick->candle.ohlc->low, 9.0);
    EXPECT_DOUBLE_EQ(tick->candle.value, 11.0);
    EXPECT_TRUE(tick->closed);
    EXPECT_EQ(tick->context.symbol, "BTCUSDT");
}

TEST(PushMessageDispatcher, CandleInsideData) {
    json message = {
        {"type", "candleUpdate"},
        {"data", {{"symbol", "ETHUSDT"}, {"candle", {{"time", 60}, {"open", "1"}, {"high", "2"},
                                                      {"low", "0.5"}, {"close", "1.5"}}}}}
    };
    auto result = PushMessageDispatcher::parse(message);

    ASSERT_EQ(result.events.size(), 1);
    auto* tick = std::get_if<CandleTickEvent>(&result.events[0]);
    ASSERT_NE(tick, nullptr);
    EXPECT_DOUBLE_EQ(tick->candle.value, 1.5);
    EXPECT_EQ(tick->context.symbol, "ETHUSDT");
    EXPECT_FALSE(tick->closed);
}

TEST(PushMessageDispatcher, IncompleteCandleDropped) {
    json message = {{"type", "candleUpdate"}, {"candle", {{"time", 60}, {"open", 1}, {"close", 2}}}};
    EXPECT_TRUE(PushMessageDispatcher::parse(message).events.empty());
}

// =============================================================================
// Indicators
// =============================================================================

TEST(PushMessageDispatcher, ParseIndicatorUpdate) {
    auto result = PushMessageDispatcher::parse(
        fixtures::indicatorUpdate("sma_20", "sma", 1700000060, {{"value", 42.5}}));

    ASSERT_EQ(result.events.size(), 1);
    auto* tick = std::get_if<IndicatorTickEvent>(&result.events[0]);
    ASSERT_NE(tick, nullptr);
    EXPECT_EQ(tick->instanceKey, "sma_20");
    EXPECT_EQ(tick->indicatorId, "sma");
    EXPECT_EQ(tick->time, 1700000060);
    ASSERT_EQ(tick->values.size(), 1);
    EXPECT_EQ(tick->values[0].first, "value");
    EXPECT_DOUBLE_EQ(tick->values[0].second, 42.5);
}

TEST(PushMessageDispatcher, NonNumericIndicatorValuesSkipped) {
    json message = fixtures::indicatorUpdate("bb", "bollinger", 60, {{"upper", 2.0}});
    message["data"]["values"]["label"] = "n/a";
    auto result = PushMessageDispatcher::parse(message);

    ASSERT_EQ(result.events.size(), 1);
    EXPECT_EQ(std::get<IndicatorTickEvent>(result.events[0]).values.size(), 1);
}

TEST(PushMessageDispatcher, TickContextMatching) {
    ChartContext active{"binance", "BTCUSDT", "1m"};

    EXPECT_TRUE((TickContext{"binance", "BTCUSDT", "1m"}.matches(active)));
    EXPECT_TRUE((TickContext{"", "BTCUSDT", ""}.matches(active)));   // absent fields match
    EXPECT_FALSE((TickContext{"", "ETHUSDT", ""}.matches(active)));
    EXPECT_FALSE((TickContext{"binance", "BTCUSDT", "5m"}.matches(active)));
}

// =============================================================================
// Control Frames
// =============================================================================

TEST(PushMessageDispatcher, SubscriptionAndConnectedFrames) {
    auto subscribed = PushMessageDispatcher::parse(fixtures::contextSubscribed(3));
    ASSERT_EQ(subscribed.events.size(), 1);
    EXPECT_EQ(std::get<ContextSubscribedEvent>(subscribed.events[0]).activeInstances, 3);

    auto missingCount = PushMessageDispatcher::parse({{"type", "contextSubscribed"}});
    ASSERT_EQ(missingCount.events.size(), 1);
    EXPECT_EQ(std::get<ContextSubscribedEvent>(missingCount.events[0]).activeInstances, 0);

    // Counts that do not fit an int drop the frame
    EXPECT_TRUE(PushMessageDispatcher::parse({{"type", "contextSubscribed"}, {"activeInstances", 1e12}}).events.empty());
    EXPECT_TRUE(PushMessageDispatcher::parse({{"type", "contextSubscribed"}, {"activeInstances", "-1e12"}}).events.empty());

    auto connected = PushMessageDispatcher::parse({{"type", "connected"}});
    ASSERT_EQ(connected.events.size(), 1);
    EXPECT_EQ(std::get<ConnectedEvent>(connected.events[0]).message, "Connected");
}

TEST(PushMessageDispatcher, ErrorFrame) {
    auto result = PushMessageDispatcher::parse(fixtures::pushError("unknown symbol"));
    ASSERT_EQ(result.events.size(), 1);
    EXPECT_EQ(std::get<PushErrorEvent>(result.events[0]).message, "unknown symbol");
}

TEST(PushMessageDispatcher, UnknownTypeReported) {
    auto result = PushMessageDispatcher::parse({{"type", "heartbeat"}});
    ASSERT_EQ(result.events.size(), 1);
    EXPECT_EQ(std::get<UnknownPushEvent>(result.events[0]).type, "heartbeat");
}

TEST(PushMessageDispatcher, NonObjectIgnored) {
    EXPECT_TRUE(PushMessageDispatcher::parse(json::array({1, 2})).events.empty());
    EXPECT_TRUE(PushMessageDispatcher::parse(json("text")).events.empty());
}

// =============================================================================
// Subscription Messages
// =============================================================================

TEST(ContextSubscription, SubscribeAndUnsubscribeFrames) {
    ContextSubscription subscription;
    EXPECT_TRUE(subscription.buildSubscribeMsg().empty());

    subscription.setContext({"binance", "BTCUSDT", "1m"});
    auto subscribe = json::parse(subscription.buildSubscribeMsg());
    EXPECT_EQ(subscribe["action"], "subscribeContext");
    EXPECT_EQ(subscribe["provider"], "binance");
    EXPECT_EQ(subscribe["symbol"], "BTCUSDT");
    EXPECT_EQ(subscribe["interval"], "1m");

    auto unsubscribe = json::parse(subscription.buildUnsubscribeMsg());
    EXPECT_EQ(unsubscribe["action"], "unsubscribeContext");
}

// =============================================================================
// Endpoint Configuration
// =============================================================================

TEST(RouterConfig, EnvironmentOverridesDefaults) {
    ::unsetenv("VANTAGE_WS_HOST");
    ::unsetenv("VANTAGE_WS_TARGET");
    ::setenv("VANTAGE_WS_PORT", "9001", 1);
    // Empty values keep the default
    ::setenv("VANTAGE_WS_TARGET", "", 1);

    const RouterConfig cfg = RouterConfig::fromEnvironment();
    EXPECT_EQ(cfg.host, "localhost");
    EXPECT_EQ(cfg.port, "9001");
    EXPECT_EQ(cfg.target, "/indicator-ws");
    EXPECT_EQ(cfg.url(), "ws://localhost:9001/indicator-ws");

    ::unsetenv("VANTAGE_WS_PORT");
    ::unsetenv("VANTAGE_WS_TARGET");
}
