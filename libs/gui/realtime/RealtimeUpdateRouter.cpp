#include "RealtimeUpdateRouter.hpp"
#include "../../core/VantageLogging.hpp"
#include "../../core/series/SeriesTransform.hpp"

#include <QMetaObject>
#include <type_traits>

namespace vantage {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

RealtimeUpdateRouter::RealtimeUpdateRouter(SeriesOverlayRegistry& registry, TransportFactory factory,
                                           RouterConfig config, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_factory(std::move(factory))
    , m_config(std::move(config))
{
    vLog_App("Realtime router targeting" << QString::fromStdString(m_config.url()));
}

RealtimeUpdateRouter::~RealtimeUpdateRouter() {
    // Joins the transport's I/O thread; nothing is delivered after this
    teardown();
}

// =============================================================================
// CONNECTION LIFECYCLE
// =============================================================================

void RealtimeUpdateRouter::setContext(const ChartContext& context) {
    const bool changed = context != m_subscription.context();
    if (!changed && m_state != ConnectionState::Disconnected && m_state != ConnectionState::Error) return;

    teardown();
    if (changed) {
        // Shapes queued for the previous context must not land on the new chart
        m_registry.scheduler()->cancelAll();
    }
    m_subscription.setContext(context);

    if (!context.valid()) {
        setState(ConnectionState::Disconnected, QStringLiteral("No connection"));
        return;
    }
    openConnection();
}

void RealtimeUpdateRouter::reconnect() {
    teardown();
    if (m_subscription.context().valid()) openConnection();
}

void RealtimeUpdateRouter::shutdown() {
    teardown();
    setState(ConnectionState::Disconnected, QStringLiteral("Disconnected"));
}

void RealtimeUpdateRouter::openConnection() {
    if (!m_factory) {
        setState(ConnectionState::Error, QStringLiteral("No transport"));
        return;
    }
    m_transport = m_factory();
    if (!m_transport) {
        setState(ConnectionState::Error, QStringLiteral("Transport unavailable"));
        return;
    }

    const quint64 generation = ++m_generation;

    m_transport->onMessage([this, generation](std::string payload) {
        QMetaObject::invokeMethod(this, [this, generation, payload = std::move(payload)]() mutable {
            onTransportFrame(generation, std::move(payload));
        }, Qt::AutoConnection);
    });
    m_transport->onStatus([this, generation](bool connected) {
        QMetaObject::invokeMethod(this, [this, generation, connected]() {
            onTransportStatus(generation, connected);
        }, Qt::AutoConnection);
    });
    m_transport->onError([this, generation](std::string message) {
        QMetaObject::invokeMethod(this, [this, generation, message = std::move(message)]() mutable {
            onTransportError(generation, std::move(message));
        }, Qt::AutoConnection);
    });

    setState(ConnectionState::Connecting, QStringLiteral("Connecting..."));
    vLog_App("Opening push channel for" << QString::fromStdString(m_subscription.context().toString())
             << "generation" << generation);
    m_transport->connect(m_config.host, m_config.port, m_config.target);
}

void RealtimeUpdateRouter::teardown() {
    if (!m_transport) return;

    if (m_state == ConnectionState::Connected) {
        const std::string unsubscribe = m_subscription.buildUnsubscribeMsg();
        if (!unsubscribe.empty()) m_transport->send(unsubscribe);
    }
    m_transport->close();
    m_transport.reset();
    // Anything still queued from the old connection is now stale
    ++m_generation;
}

void RealtimeUpdateRouter::setState(ConnectionState state, const QString& message) {
    if (m_state == state && m_statusMessage == message) return;
    m_state = state;
    m_statusMessage = message;
    vLog_App("Push channel" << toString(state) << message);
    emit stateChanged(state, message);
}

void RealtimeUpdateRouter::onTransportStatus(quint64 generation, bool connected) {
    if (generation != m_generation) return;

    if (!connected) {
        setState(ConnectionState::Disconnected, QStringLiteral("Disconnected"));
        return;
    }

    setState(ConnectionState::Connected, QStringLiteral("Connected"));
    const std::string subscribe = m_subscription.buildSubscribeMsg();
    if (!subscribe.empty() && m_transport) {
        m_transport->send(subscribe);
    }
}

void RealtimeUpdateRouter::onTransportFrame(quint64 generation, std::string payload) {
    if (generation != m_generation) {
        ++m_stats.staleFrames;
        return;
    }
    handleFrame(payload);
}

void RealtimeUpdateRouter::onTransportError(quint64 generation, std::string message) {
    if (generation != m_generation) return;
    vLog_Warning("Push channel error:" << QString::fromStdString(message));
    setState(ConnectionState::Error, QStringLiteral("Connection error"));
}

// =============================================================================
// ROUTING
// =============================================================================

void RealtimeUpdateRouter::handleFrame(const std::string& payload) {
    ++m_stats.framesReceived;

    Json message;
    try {
        message = Json::parse(payload);
    } catch (const Json::exception& e) {
        vLog_Warning("Unparseable push frame:" << e.what());
        setState(ConnectionState::Error, QStringLiteral("Parse error"));
        return;
    }

    for (const auto& event : PushMessageDispatcher::parse(message).events) {
        handleEvent(event);
    }
}

void RealtimeUpdateRouter::handleEvent(const PushEvent& event) {
    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, ConnectedEvent>) {
            setState(ConnectionState::Connected, QString::fromStdString(ev.message));
        } else if constexpr (std::is_same_v<T, ContextSubscribedEvent>) {
            setState(ConnectionState::Connected, QStringLiteral("Subscribed: %1 indicators").arg(ev.activeInstances));
            emit contextSubscribed(ev.activeInstances);
        } else if constexpr (std::is_same_v<T, CandleTickEvent>) {
            if (!ev.context.matches(m_subscription.context())) {
                ++m_stats.contextMismatches;
                vLog_Data("Candle tick for another context discarded");
                return;
            }
            applyCandle(ev);
        } else if constexpr (std::is_same_v<T, IndicatorTickEvent>) {
            if (!ev.context.matches(m_subscription.context())) {
                ++m_stats.contextMismatches;
                vLog_Data("Indicator tick for another context discarded");
                return;
            }
            applyIndicator(ev);
        } else if constexpr (std::is_same_v<T, PushErrorEvent>) {
            vLog_Warning("Push channel reported:" << QString::fromStdString(ev.message));
            setState(ConnectionState::Error, QStringLiteral("Error: %1").arg(QString::fromStdString(ev.message)));
        } else {
            vLog_Data("Unhandled push message type" << QString::fromStdString(ev.type));
        }
    }, event);
}

bool RealtimeUpdateRouter::applyCandle(const CandleTickEvent& tick) {
    ISeriesApi* main = m_registry.mainSeries();
    if (!main) {
        vLog_Warning("Candle tick before the main series exists");
        ++m_stats.candlesRejected;
        return false;
    }

    if (!main->update(tick.candle)) {
        ++m_stats.candlesRejected;
        vLog_Warning("Candle tick at" << tick.candle.time << "rejected: older than the last bar");
        return false;
    }

    ++m_stats.candlesApplied;
    vLog_Data("Candle tick" << tick.candle.time << "close" << tick.candle.value << (tick.closed ? "(closed)" : ""));
    emit candleApplied(static_cast<qint64>(tick.candle.time), tick.closed);
    return true;
}

std::vector<std::string> RealtimeUpdateRouter::candidateIds(const std::string& instanceKey,
                                                            const std::string& indicatorId,
                                                            const std::string& field) {
    const std::string prefix = "indicator_" + instanceKey;
    return {prefix + "_" + field, prefix + "_" + indicatorId, prefix};
}

int RealtimeUpdateRouter::applyIndicator(const IndicatorTickEvent& tick) {
    int applied = 0;
    for (const auto& [field, value] : tick.values) {
        const auto candidates = candidateIds(tick.instanceKey, tick.indicatorId, field);

        ISeriesApi* target = nullptr;
        const std::string* targetId = nullptr;
        for (const auto& id : candidates) {
            if (ISeriesApi* handle = m_registry.seriesHandle(id)) {
                target = handle;
                targetId = &id;
                break;
            }
        }

        if (!target) {
            ++m_stats.indicatorValuesDropped;
            vLog_Warning("No series for indicator field" << QString::fromStdString(field)
                         << "tried" << QString::fromStdString(candidates[0])
                         << QString::fromStdString(candidates[1])
                         << QString::fromStdString(candidates[2]));
            continue;
        }

        SeriesPoint point;
        point.time = tick.time;
        point.value = value;
        if (target->kind() == SeriesKind::Histogram) {
            point.color = value >= 0.0 ? target->options().color.name(QColor::HexRgb).toStdString()
                                       : SeriesTransform::kNegativeHistogramColor;
        }

        if (!target->update(point)) {
            ++m_stats.indicatorValuesDropped;
            vLog_Warning("Indicator tick for" << QString::fromStdString(*targetId) << "at" << tick.time
                         << "rejected: older than the last point");
            continue;
        }
        ++m_stats.indicatorValuesApplied;
        ++applied;
        vLog_Data("Indicator" << QString::fromStdString(*targetId) << "=" << value << "at" << tick.time);
    }
    return applied;
}

bool RealtimeUpdateRouter::replaceCandles(std::vector<SeriesPoint> candles) {
    ISeriesApi* main = m_registry.mainSeries();
    if (!main || candles.empty()) {
        vLog_Warning("Cannot replace candles: missing data or main series");
        return false;
    }
    candles = SeriesTransform::dedupAndSort(std::move(candles));
    const size_t count = candles.size();
    main->setData(std::move(candles));
    vLog_App("Replaced main series with" << count << "candles");
    return true;
}

} // namespace vantage
