#include "config.h"
#include "terrain_errors.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

bool ConfigFile::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::warning() << "Failed to open settings file: " << filepath;
        return false;
    }

    std::string currentSection;
    std::string line;
    while (std::getline(file, line)) {
        parseLine(line, currentSection);
    }
    return true;
}

bool ConfigFile::loadFromString(const std::string& text) {
    std::istringstream stream(text);
    std::string currentSection;
    std::string line;
    while (std::getline(stream, line)) {
        parseLine(line, currentSection);
    }
    return true;
}

void ConfigFile::parseLine(const std::string& rawLine, std::string& currentSection) {
    std::string line = trim(rawLine);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    if (line[0] == '[' && line[line.length() - 1] == ']') {
        currentSection = trim(line.substr(1, line.length() - 2));
        return;
    }

    size_t equalPos = line.find('=');
    if (equalPos == std::string::npos) {
        Logger::warning() << "Ignoring malformed settings line: " << line;
        return;
    }

    std::string key = trim(line.substr(0, equalPos));
    std::string value = trim(line.substr(equalPos + 1));

    // Remove inline comments
    size_t commentPos = value.find_first_of("#;");
    if (commentPos != std::string::npos) {
        value = trim(value.substr(0, commentPos));
    }

    if (!currentSection.empty() && !key.empty()) {
        m_data[currentSection][key] = value;
    }
}

bool ConfigFile::has(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    return sectionIt != m_data.end() && sectionIt->second.count(key) > 0;
}

int ConfigFile::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    if (!has(section, key)) {
        return defaultValue;
    }
    const std::string& text = m_data.at(section).at(key);
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    Logger::warning() << "Failed to parse int for [" << section << "]:" << key << " = '" << text << "'";
    return defaultValue;
}

bool ConfigFile::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    if (!has(section, key)) {
        return defaultValue;
    }
    std::string text = m_data.at(section).at(key);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "on" || text == "1") return true;
    if (text == "false" || text == "no" || text == "off" || text == "0") return false;

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key << " = '" << text << "'";
    return defaultValue;
}

std::string ConfigFile::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    if (!has(section, key)) {
        return defaultValue;
    }
    return m_data.at(section).at(key);
}

std::string ConfigFile::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool ConfigFile::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open settings file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }
    return file.good();
}

void ConfigFile::setInt(const std::string& section, const std::string& key, int value) {
    m_data[section][key] = std::to_string(value);
}

void ConfigFile::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "true" : "false";
}

void ConfigFile::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}

// ========== World settings ==========

WorldSettings worldSettingsFromConfig(const ConfigFile& config) {
    WorldSettings settings;

    settings.dimensions.width = config.getInt("chunk", "width", settings.dimensions.width);
    settings.dimensions.height = config.getInt("chunk", "height", settings.dimensions.height);
    settings.dimensions.subchunkDepth = config.getInt("chunk", "subchunk_depth", settings.dimensions.subchunkDepth);
    settings.dimensions.numSubchunks = config.getInt("chunk", "num_subchunks", settings.dimensions.numSubchunks);
    settings.dimensions.validate();

    settings.chunksDirectory = config.getString("storage", "chunks_dir", settings.chunksDirectory);
    if (settings.chunksDirectory.empty()) {
        throw ConfigError("[storage] chunks_dir must not be empty");
    }

    if (config.has("logging", "level")) {
        const std::string levelText = config.getString("logging", "level");
        if (!tryParseLogLevel(levelText, settings.logLevel)) {
            Logger::warning() << "Unknown log level '" << levelText << "', using "
                              << logLevelName(settings.logLevel);
        }
    }
    settings.logColors = config.getBool("logging", "colors", settings.logColors);

    return settings;
}

WorldSettings loadWorldSettings(const std::string& filepath) {
    ConfigFile config;
    if (!config.loadFromFile(filepath)) {
        Logger::warning() << "Using default world settings";
        return WorldSettings{};
    }
    return worldSettingsFromConfig(config);
}

void applyLoggingSettings(const WorldSettings& settings) {
    Logger::setMinLevel(settings.logLevel);
    Logger::setUseColors(settings.logColors);
}
