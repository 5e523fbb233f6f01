#include "Log.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (lower == "debug") {
        level = LogLevel::Debug;
    } else if (lower == "info") {
        level = LogLevel::Info;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::Warning;
    } else if (lower == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void log_message(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::lock_guard lock(g_write_mutex);
    std::cerr << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << " " << level_label(level) << ": " << message << std::endl;
}
