#pragma once
#include <string>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Log lines go to stderr; stdout belongs to the stdio transport.
void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts debug, info, warning (or warn), error; case-insensitive.
bool parse_log_level(const std::string& text, LogLevel& level);

void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_message(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::Info, message); }
inline void log_warning(const std::string& message) { log_message(LogLevel::Warning, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::Error, message); }
