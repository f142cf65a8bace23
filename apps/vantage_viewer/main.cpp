/*
Vantage — main.cpp
Role: Entry point for the Vantage viewer: a chart window with indicator overlays loaded from a
  JSON fixture and live ticks from the indicator push channel.
Usage: vantage_viewer [chart.json]
  chart.json: {"context": {provider, symbol, interval}, "candles": [...], "indicators": {id: response}}
  The push endpoint comes from VANTAGE_WS_HOST / VANTAGE_WS_PORT / VANTAGE_WS_TARGET.
*/
#include "OverlayChartItem.hpp"
#include "VantageLogging.hpp"

#include <QFile>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickWindow>
#include "VantageJson.hpp"

namespace {

const char* kViewerQml = R"(
import QtQuick
import QtQuick.Window
import Vantage.Charts 1.0

Window {
    width: 1280
    height: 720
    visible: true
    color: "#131722"
    title: "Vantage"

    OverlayChart {
        id: chart
        objectName: "chart"
        anchors.fill: parent
    }

    Text {
        anchors.left: parent.left
        anchors.top: parent.top
        anchors.margins: 8
        color: "#d1d4dc"
        font.pixelSize: 12
        text: chart.connectionState + " | " + chart.connectionStatus + " | overlays: " + chart.overlayCount
    }
}
)";

void registerMetaTypesAndQml() {
    qRegisterMetaType<vantage::ConnectionState>();
    qmlRegisterType<vantage::OverlayChartItem>("Vantage.Charts", 1, 0, "OverlayChart");
}

// Fixture loading; a missing or malformed file leaves an empty chart
bool loadFixture(vantage::OverlayChartItem& chart, const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        vLog_Warning("Cannot open chart fixture" << path);
        return false;
    }

    vantage::Json fixture;
    try {
        fixture = vantage::Json::parse(file.readAll().toStdString());
    } catch (const vantage::Json::exception& e) {
        vLog_Warning("Chart fixture is not JSON:" << e.what());
        return false;
    }
    if (!fixture.is_object()) return false;

    if (auto candles = fixture.find("candles"); candles != fixture.end()) {
        chart.loadCandles(QString::fromStdString(candles->dump()));
    }
    if (auto indicators = fixture.find("indicators"); indicators != fixture.end() && indicators->is_object()) {
        for (auto it = indicators->begin(); it != indicators->end(); ++it) {
            chart.addIndicator(QString::fromStdString(it.key()), QString::fromStdString(it.value().dump()));
        }
    }
    if (auto context = fixture.find("context"); context != fixture.end() && context->is_object()) {
        chart.setContext(QString::fromStdString(context->value("provider", "")),
                         QString::fromStdString(context->value("symbol", "")),
                         QString::fromStdString(context->value("interval", "")));
    }
    vLog_App("Loaded chart fixture" << path);
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    vLog_App("[Vantage viewer starting]");

    QGuiApplication app(argc, argv);
    registerMetaTypesAndQml();

    QQmlApplicationEngine engine;
    engine.loadData(QByteArray(kViewerQml));
    if (engine.rootObjects().isEmpty()) {
        vLog_Error("Viewer QML failed to load");
        return 1;
    }

    auto* chart = engine.rootObjects().first()->findChild<vantage::OverlayChartItem*>("chart");
    if (!chart) {
        vLog_Error("Chart item missing from the viewer scene");
        return 1;
    }

    const QStringList args = app.arguments();
    if (args.size() > 1) {
        loadFixture(*chart, args.at(1));
    }

    return app.exec();
}
