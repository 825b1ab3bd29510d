#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace fetchd {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel logLevel() noexcept;

// Accepts "debug", "info", "warn", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parseLogLevel(std::string_view text, LogLevel& out);

// Applies FETCHD_LOG_LEVEL from the environment when set and valid.
void initLogLevelFromEnv();

namespace detail {
void writeLog(LogLevel level, const std::string& message);
} // namespace detail

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    if (LogLevel::Debug < logLevel()) {
        return;
    }
    detail::writeLog(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    if (LogLevel::Info < logLevel()) {
        return;
    }
    detail::writeLog(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    if (LogLevel::Warn < logLevel()) {
        return;
    }
    detail::writeLog(LogLevel::Warn, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    if (LogLevel::Error < logLevel()) {
        return;
    }
    detail::writeLog(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace fetchd
