#pragma once

#include <string>

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Global verbosity, Info by default.
void setLogLevel(LogLevel level) noexcept;
LogLevel getLogLevel() noexcept;

// Parses "debug", "info", "warn" or "error". Returns false on anything else.
bool parseLogLevel(const std::string& text, LogLevel& level);

// Never throws. Warn and Error go to stderr, the rest to stdout.
void logMessage(LogLevel level, const std::string& msg) noexcept;
