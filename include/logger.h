/**
 * @file logger.h
 * @brief Stream-style logging with severity levels for the terrain store
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk persistence traffic, allocation details
    INFO,     ///< Registry loading, world setup
    WARNING,  ///< Skipped config entries, fallbacks to defaults
    ERROR     ///< Failed saves/loads
};

/**
 * @brief Parses a level name as written in a settings file
 *
 * Accepts "debug", "info", "warning"/"warn" and "error" (case-insensitive).
 *
 * @param text Level name
 * @param fallback Level returned when the name is not recognised
 * @return Parsed level
 */
LogLevel parseLogLevel(const std::string& text, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Parses a level name, reporting whether it was recognised
 * @return False (level untouched) for an unknown name
 */
bool tryParseLogLevel(const std::string& text, LogLevel& level);

/**
 * @brief Returns the lowercase name of a level ("debug", "info", ...)
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Thread-safe logger with severity levels
 *
 * Usage:
 * @code
 * Logger::info() << "Loaded " << count << " block definitions";
 * Logger::error() << "Failed to write chunk file: " << path;
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        explicit LogStream(LogLevel level) : m_level(level) {}

        /**
         * @brief Flushes the accumulated message to stdout/stderr
         */
        ~LogStream() {
            if (!Logger::shouldLog(m_level)) {
                return;
            }

            std::lock_guard<std::mutex> lock(s_mutex);
            std::ostream& out = (m_level >= LogLevel::ERROR) ? std::cerr : std::cout;

            if (s_useColors) {
                switch (m_level) {
                    case LogLevel::DEBUG:   out << "\033[36m[DEBUG]\033[0m "; break;
                    case LogLevel::INFO:    out << "\033[32m[INFO]\033[0m "; break;
                    case LogLevel::WARNING: out << "\033[33m[WARNING]\033[0m "; break;
                    case LogLevel::ERROR:   out << "\033[31m[ERROR]\033[0m "; break;
                }
            } else {
                switch (m_level) {
                    case LogLevel::DEBUG:   out << "[DEBUG] "; break;
                    case LogLevel::INFO:    out << "[INFO] "; break;
                    case LogLevel::WARNING: out << "[WARNING] "; break;
                    case LogLevel::ERROR:   out << "[ERROR] "; break;
                }
            }

            out << m_stream.str() << std::endl;
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (Logger::shouldLog(m_level)) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        std::ostringstream m_stream;
    };

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum log level; messages below it are suppressed
     */
    static void setMinLevel(LogLevel level) { s_minLevel = level; }

    static LogLevel getMinLevel() { return s_minLevel; }

    /**
     * @brief Enables or disables ANSI colour prefixes
     */
    static void setUseColors(bool enable) { s_useColors = enable; }

    static bool shouldLog(LogLevel level) { return level >= s_minLevel; }

private:
    static LogLevel s_minLevel;
    static bool s_useColors;
    static std::mutex s_mutex;
};
