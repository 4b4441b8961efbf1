/**
 * @file config.h
 * @brief INI-style settings file and the world settings read from it
 */

#pragma once

#include <string>
#include <map>
#include "chunk_dimensions.h"
#include "logger.h"

/**
 * @brief Parsed INI file: [section] headers with key = value pairs
 *
 * Lines starting with '#' or ';' are comments, inline comments are stripped.
 * Keys outside any section are ignored.
 */
class ConfigFile {
public:
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& text);
    bool saveToFile(const std::string& filepath) const;

    bool has(const std::string& section, const std::string& key) const;

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& section, const std::string& key, int value);
    void setBool(const std::string& section, const std::string& key, bool value);
    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    void parseLine(const std::string& rawLine, std::string& currentSection);
    std::string trim(const std::string& str) const;

    std::map<std::string, std::map<std::string, std::string>> m_data;
};

/**
 * @brief Everything a World and its host need from the settings file
 */
struct WorldSettings {
    ChunkDimensions dimensions;               ///< [chunk] section
    std::string chunksDirectory = "chunks";   ///< [storage] chunks_dir
    LogLevel logLevel = LogLevel::INFO;       ///< [logging] level
    bool logColors = true;                    ///< [logging] colors
};

/**
 * @brief Builds WorldSettings from a parsed file, defaults for missing keys
 * @throws ConfigError if the resulting dimensions or directory are invalid
 */
WorldSettings worldSettingsFromConfig(const ConfigFile& config);

/**
 * @brief Loads WorldSettings from an INI file
 *
 * A missing or unreadable file yields the defaults (logged as a warning).
 *
 * @throws ConfigError if a present value fails validation
 */
WorldSettings loadWorldSettings(const std::string& filepath);

/**
 * @brief Applies the logging part of the settings to the Logger
 */
void applyLoggingSettings(const WorldSettings& settings);
