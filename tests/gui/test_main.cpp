/*
Vantage — GUI Test Runner
Role: Hosts the GUI-side suites inside a QGuiApplication so QObject timers, fonts and
  QPainter-backed drawing work.
Testing Strategy: Offscreen platform unless the environment chooses one.
*/
#include <gtest/gtest.h>
#include <QGuiApplication>

int main(int argc, char** argv) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
