/*
Vantage — ChannelLog
Role: fmt-style logging for the push-channel transport, routed into the vantage.data category so
  transport lines share the sink and QT_LOGGING_RULES filtering of the rest of the engine.
Inputs/Outputs: A connection tag plus an fmt format string; one Qt log record per call.
Threading: Safe from the Beast I/O thread; Qt logging is thread-safe and nothing here is shared.
Usage:
  vLog_Channel(Info, m_tag, "Connected to {}", url);
  vLog_Channel(Warning, m_tag, "{} failed: {}", stage, ec.message());
*/
#pragma once
#include "VantageLogging.hpp"

#include <fmt/format.h>
#include <QString>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace vantage::channel_log {

enum class Level { Debug, Info, Warning, Critical };

// "ws#<n>": one tag per transport instance, so a closing connection and its replacement can be told apart
inline std::string nextTag() {
    static std::atomic<std::uint32_t> counter{0};
    return fmt::format("ws#{}", ++counter);
}

inline std::string formatLine(std::string_view tag, std::string_view message) {
    return fmt::format("[{}] {}", tag, message);
}

template <class... Args>
void write(Level level, std::string_view tag, fmt::format_string<Args...> format, Args&&... args) {
    const QString text = QString::fromStdString(formatLine(tag, fmt::format(format, std::forward<Args>(args)...)));
    switch (level) {
        case Level::Debug:    qCDebug(logData).noquote() << text; break;
        case Level::Info:     qCInfo(logData).noquote() << text; break;
        case Level::Warning:  qCWarning(logData).noquote() << text; break;
        case Level::Critical: qCCritical(logData).noquote() << text; break;
    }
}

} // namespace vantage::channel_log

#define vLog_Channel(level, tag, ...) \
    ::vantage::channel_log::write(::vantage::channel_log::Level::level, tag, __VA_ARGS__)
