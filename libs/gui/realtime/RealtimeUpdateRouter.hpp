/*
Vantage — RealtimeUpdateRouter
Role: Owns the push-channel connection for the active chart context and routes every tick to
  exactly one overlay: candles to the main series, indicator values to their registry series.
Inputs/Outputs: JSON frames from a WsTransport; ISeriesApi::update() calls and state signals out.
Threading: Lives on the GUI thread. Transport callbacks arrive on the transport's I/O thread and
  are marshalled here with QMetaObject::invokeMethod; each carries the generation of the
  connection that produced it so frames from a torn-down connection are dropped.
Performance: One JSON parse per frame; id resolution is at most three map lookups per field.
Integration: Created by OverlayChartItem with a BeastWsTransport factory; tests inject fakes.
Observability: vLog_Data per tick (throttled), vLog_Warning for unresolvable ticks and rejected
  candles, stateChanged() for the UI.
Related: RealtimeUpdateRouter.cpp, PushMessageDispatcher.hpp, ContextSubscription.hpp,
  RouterConfig.hpp, SeriesOverlayRegistry.hpp.
Assumptions: The registry outlives the router.
*/
#pragma once
#include "../overlay/SeriesOverlayRegistry.hpp"
#include "../../core/realtime/ContextSubscription.hpp"
#include "../../core/realtime/PushMessageDispatcher.hpp"
#include "../../core/realtime/RouterConfig.hpp"
#include "../../core/realtime/WsTransport.hpp"

#include <QMetaType>
#include <QObject>
#include <QString>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vantage {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

const char* toString(ConnectionState state);

struct RouterStats {
    uint64_t framesReceived = 0;
    uint64_t staleFrames = 0;          // from a torn-down connection
    uint64_t contextMismatches = 0;
    uint64_t candlesApplied = 0;
    uint64_t candlesRejected = 0;
    uint64_t indicatorValuesApplied = 0;
    uint64_t indicatorValuesDropped = 0;
};

class RealtimeUpdateRouter : public QObject {
    Q_OBJECT

public:
    using TransportFactory = std::function<std::unique_ptr<WsTransport>()>;

    RealtimeUpdateRouter(SeriesOverlayRegistry& registry, TransportFactory factory,
                         RouterConfig config = {}, QObject* parent = nullptr);
    ~RealtimeUpdateRouter() override;

    // A different valid context reconnects; an invalid one leaves the router disconnected
    void setContext(const ChartContext& context);
    const ChartContext& context() const { return m_subscription.context(); }

    void reconnect();
    void shutdown();

    ConnectionState state() const { return m_state; }
    const QString& statusMessage() const { return m_statusMessage; }
    quint64 generation() const { return m_generation; }
    const RouterStats& stats() const { return m_stats; }
    const RouterConfig& config() const { return m_config; }

    // Routing entry points; the transport path ends here, replay and tests call them directly
    void handleFrame(const std::string& payload);
    void handleEvent(const PushEvent& event);
    bool applyCandle(const CandleTickEvent& tick);
    int applyIndicator(const IndicatorTickEvent& tick);

    // Whole-series replace of the main candles (replay, resync)
    bool replaceCandles(std::vector<SeriesPoint> candles);

    // indicator_<key>_<field>, indicator_<key>_<indicatorId>, indicator_<key>
    static std::vector<std::string> candidateIds(const std::string& instanceKey,
                                                 const std::string& indicatorId,
                                                 const std::string& field);

signals:
    void stateChanged(vantage::ConnectionState state, const QString& message);
    void contextSubscribed(int activeInstances);
    void candleApplied(qint64 time, bool closed);

private:
    void openConnection();
    void teardown();
    void setState(ConnectionState state, const QString& message);

    void onTransportStatus(quint64 generation, bool connected);
    void onTransportFrame(quint64 generation, std::string payload);
    void onTransportError(quint64 generation, std::string message);

    SeriesOverlayRegistry& m_registry;
    TransportFactory m_factory;
    RouterConfig m_config;
    ContextSubscription m_subscription;

    std::unique_ptr<WsTransport> m_transport;
    quint64 m_generation = 0;
    ConnectionState m_state = ConnectionState::Disconnected;
    QString m_statusMessage = QStringLiteral("No connection");
    RouterStats m_stats;
};

} // namespace vantage

Q_DECLARE_METATYPE(vantage::ConnectionState)
