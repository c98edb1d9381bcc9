#include "netwatch/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace netwatch {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: break;
    }
    return "OFF";
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::Debug;
    } else if (lower == "info") {
        level = LogLevel::Info;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::Warning;
    } else if (lower == "error") {
        level = LogLevel::Error;
    } else if (lower == "off") {
        level = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

void logMessage(LogLevel level, const char* component, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    struct tm local;
    localtime_r(&t, &local);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << std::put_time(&local, "%H:%M:%S") << "."
              << std::setw(3) << std::setfill('0') << millis << std::setfill(' ')
              << " [" << level_name(level) << "] "
              << component << ": " << message << std::endl;
}

} // namespace netwatch
