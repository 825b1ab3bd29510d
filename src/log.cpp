#include "fetchd/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace fetchd {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;

const char* levelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        break;
    }
    return "-";
}

std::string currentTime() {
    const auto now = std::chrono::system_clock::now();
    const auto t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return fmt::format("{}.{:03}", buf, ms.count());
}

} // namespace

void setLogLevel(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

LogLevel logLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool parseLogLevel(std::string_view text, LogLevel& out) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        out = LogLevel::Debug;
    } else if (lowered == "info") {
        out = LogLevel::Info;
    } else if (lowered == "warn" || lowered == "warning") {
        out = LogLevel::Warn;
    } else if (lowered == "error") {
        out = LogLevel::Error;
    } else if (lowered == "off") {
        out = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

void initLogLevelFromEnv() {
    const char* value = std::getenv("FETCHD_LOG_LEVEL");
    if (!value) {
        return;
    }
    LogLevel level = LogLevel::Info;
    if (parseLogLevel(value, level)) {
        setLogLevel(level);
    } else {
        logWarn("ignoring invalid FETCHD_LOG_LEVEL '{}'", value);
    }
}

namespace detail {

void writeLog(LogLevel level, const std::string& message) {
    const std::string line = fmt::format("[{}] [{}] {}\n", currentTime(), levelName(level), message);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fwrite(line.data(), 1, line.size(), stderr);
}

} // namespace detail

} // namespace fetchd
