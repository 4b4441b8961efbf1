/**
 * @file block_registry.cpp
 * @brief YAML loading of block capability definitions
 */

#include "block_registry.h"
#include "logger.h"
#include <yaml-cpp/yaml.h>

namespace {

const char* const FLAG_KEYS[5] = {
    "is_hoverable",
    "is_visible",
    "is_breakable",
    "is_collidable",
    "is_replaceable"
};

} // namespace

BlockRegistry::BlockRegistry() {
    for (std::size_t i = 0; i < BLOCK_TYPE_COUNT; i++) {
        m_defs[i] = builtinBlockDefinition(static_cast<BlockType>(i));
        m_loaded[i] = false;
    }
}

bool BlockRegistry::loadFromFile(const std::string& filepath) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        Logger::error() << "Error parsing block definitions " << filepath << ": " << e.what();
        return false;
    }
    return loadDocument(doc, filepath);
}

bool BlockRegistry::loadFromString(const std::string& text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        Logger::error() << "Error parsing block definitions: " << e.what();
        return false;
    }
    return loadDocument(doc, "<string>");
}

bool BlockRegistry::loadDocument(const YAML::Node& doc, const std::string& source) {
    if (!doc.IsMap()) {
        Logger::error() << "Block definitions in " << source << " must be a mapping of block names";
        return false;
    }

    int loaded = 0;
    for (const auto& entry : doc) {
        std::string name;
        try {
            name = entry.first.as<std::string>();
        } catch (const YAML::Exception&) {
            Logger::warning() << "Skipping block entry with a non-string name in " << source;
            continue;
        }

        BlockType type = blockTypeFromString(name);
        if (type == BlockType::Missing) {
            Logger::warning() << "Unknown block '" << name << "' in " << source << "; skipping.";
            continue;
        }

        const YAML::Node& props = entry.second;
        if (!props.IsMap()) {
            Logger::warning() << "Block '" << name << "' has no flag mapping; skipping.";
            continue;
        }

        bool flags[5] = {};
        bool complete = true;
        for (int i = 0; i < 5; i++) {
            if (!props[FLAG_KEYS[i]]) {
                Logger::warning() << "Block '" << name << "' is missing '" << FLAG_KEYS[i] << "'; skipping.";
                complete = false;
                break;
            }
            try {
                flags[i] = props[FLAG_KEYS[i]].as<bool>();
            } catch (const YAML::Exception&) {
                Logger::warning() << "Block '" << name << "' has a non-boolean '" << FLAG_KEYS[i] << "'; skipping.";
                complete = false;
                break;
            }
        }
        if (!complete) {
            continue;
        }

        std::size_t index = static_cast<std::size_t>(type);
        if (m_loaded[index]) {
            Logger::warning() << "Duplicate block '" << name << "' in " << source << "; replacing.";
        }
        m_defs[index] = BlockDefinition(type, flags[0], flags[1], flags[2], flags[3], flags[4]);
        m_loaded[index] = true;
        loaded++;
    }

    Logger::info() << "Loaded " << loaded << " block definitions from " << source;
    return true;
}

const BlockDefinition& BlockRegistry::get(BlockType type) const {
    std::size_t index = static_cast<std::size_t>(type);
    if (index >= BLOCK_TYPE_COUNT) {
        return builtinBlockDefinition(BlockType::Missing);
    }
    return m_defs[index];
}

bool BlockRegistry::isLoaded(BlockType type) const {
    std::size_t index = static_cast<std::size_t>(type);
    return index < BLOCK_TYPE_COUNT && m_loaded[index];
}

int BlockRegistry::count() const {
    int total = 0;
    for (bool loaded : m_loaded) {
        if (loaded) {
            total++;
        }
    }
    return total;
}
