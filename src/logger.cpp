/**
 * @file logger.cpp
 * @brief Logger state and level parsing
 */

#include "logger.h"
#include <algorithm>
#include <cctype>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
std::mutex Logger::s_mutex;

bool tryParseLogLevel(const std::string& text, LogLevel& level) {
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "debug") {
        level = LogLevel::DEBUG;
    } else if (normalized == "info") {
        level = LogLevel::INFO;
    } else if (normalized == "warning" || normalized == "warn") {
        level = LogLevel::WARNING;
    } else if (normalized == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

LogLevel parseLogLevel(const std::string& text, LogLevel fallback) {
    LogLevel level = fallback;
    if (tryParseLogLevel(text, level)) {
        return level;
    }
    return fallback;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "debug";
        case LogLevel::INFO:    return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
        default:                return "info";
    }
}
