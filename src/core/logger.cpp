#include "core/logger.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace skirmish::core {
namespace {

std::atomic<int> g_minimum_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "?";
}

// "HH:MM:SS.mmm" in local time.
void FormatClock(char (&out)[16]) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::snprintf(
        out, sizeof(out), "%02d:%02d:%02d.%03lld",
        local.tm_hour, local.tm_min, local.tm_sec, millis);
}

}  // namespace

void Logger::Info(std::string_view module, std::string_view message) {
    Write(LogLevel::Info, module, message);
}

void Logger::Warn(std::string_view module, std::string_view message) {
    Write(LogLevel::Warn, module, message);
}

void Logger::Error(std::string_view module, std::string_view message) {
    Write(LogLevel::Error, module, message);
}

void Logger::SetMinimumLevel(LogLevel level) {
    g_minimum_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::MinimumLevel() {
    return static_cast<LogLevel>(g_minimum_level.load(std::memory_order_relaxed));
}

bool Logger::ParseLevel(std::string_view text, LogLevel& out_level) {
    if (text == "info") {
        out_level = LogLevel::Info;
    } else if (text == "warn") {
        out_level = LogLevel::Warn;
    } else if (text == "error") {
        out_level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void Logger::Write(LogLevel level, std::string_view module, std::string_view message) {
    if (static_cast<int>(level) < g_minimum_level.load(std::memory_order_relaxed)) {
        return;
    }

    char clock[16]{};
    FormatClock(clock);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& stream = level == LogLevel::Error ? std::cerr : std::cout;
    stream << clock << ' ' << LevelTag(level) << " [" << module << "] " << message << '\n';
}

}  // namespace skirmish::core
