#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// VANTAGE LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for hot paths (repaint, ticks)

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: lifecycle, config, registry CRUD
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: push channel, ticks, API ingest
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: primitives, coordinates, repaint
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace vantage::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // every app event
    inline constexpr int kData   = 20;   // every 20th tick / ingest message
    inline constexpr int kRender = 100;  // every 100th repaint message
    inline constexpr int kDebug  = 10;
}

// Throttled logging with a runtime override: VANTAGE_LOG_<cat>_INTERVAL
#define VLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("VANTAGE_LOG_" #cat "_INTERVAL");         \
            const int v = env ? std::atoi(env) : (defaultInterval);                  \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if ((++_counter % _interval) == 1 % _interval) {                             \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define vLog_App(...)     VLOG_THROTTLED(App, vantage::log_throttle::kApp, __VA_ARGS__)
#define vLog_Data(...)    VLOG_THROTTLED(Data, vantage::log_throttle::kData, __VA_ARGS__)
#define vLog_Render(...)  VLOG_THROTTLED(Render, vantage::log_throttle::kRender, __VA_ARGS__)
#define vLog_Debug(...)   VLOG_THROTTLED(Debug, vantage::log_throttle::kDebug, __VA_ARGS__)

#define vLog_AppN(n, ...)    VLOG_THROTTLED(App, n, __VA_ARGS__)
#define vLog_DataN(n, ...)   VLOG_THROTTLED(Data, n, __VA_ARGS__)
#define vLog_RenderN(n, ...) VLOG_THROTTLED(Render, n, __VA_ARGS__)
#define vLog_DebugN(n, ...)  VLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on (no throttling)
#define vLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define vLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

// =============================================================================
// RUNTIME CONTROL
// =============================================================================
//   export VANTAGE_LOG_Data_INTERVAL=1      # every tick
//   export VANTAGE_LOG_Render_INTERVAL=10   # every 10th repaint message
//   export QT_LOGGING_RULES="vantage.*.debug=true"
//
// Usage:
//   vLog_App("Registry attached to host");
//   vLog_Data("Indicator tick" << QString::fromStdString(key) << value);
//   vLog_RenderN(50, "Lines drawn:" << count);
