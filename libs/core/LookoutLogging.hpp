#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// LOOKOUT LOGGING CATEGORIES
// =============================================================================
// Three categories. Each supports atomic throttling for high-frequency paths
// (progress frames arrive several times per second per download).

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: lifecycle, config, credentials
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: WebSocket, codec, projection updates
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace lookout::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Every app event (low frequency)
    inline constexpr int kData  = 20;   // Every 20th data operation
    inline constexpr int kDebug = 10;   // Every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define LLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("LOOKOUT_LOG_" #cat "_INTERVAL");         \
            const int v = env ? std::atoi(env) : (defaultInterval);                  \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define lLog_App(...)     LLOG_THROTTLED(App, lookout::log_throttle::kApp, __VA_ARGS__)
#define lLog_Data(...)    LLOG_THROTTLED(Data, lookout::log_throttle::kData, __VA_ARGS__)
#define lLog_Debug(...)   LLOG_THROTTLED(Debug, lookout::log_throttle::kDebug, __VA_ARGS__)

#define lLog_AppN(n, ...)    LLOG_THROTTLED(App, n, __VA_ARGS__)
#define lLog_DataN(n, ...)   LLOG_THROTTLED(Data, n, __VA_ARGS__)

// Always-on (no throttling for critical messages)
#define lLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define lLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
USAGE:
lLog_App("Connection manager started");
lLog_Data("Progress for" << id << bytes);              // throttled, every 20th
lLog_DataN(1, "Snapshot with" << n << "downloads");     // never throttled

RUNTIME CONTROL:
export LOOKOUT_LOG_Data_INTERVAL=1        # See every data operation
export QT_LOGGING_RULES="lookout.*.debug=true"
*/
