/**
 * @file block_registry.h
 * @brief Block capability definitions loaded from YAML
 */

#pragma once

#include <array>
#include <string>
#include "block.h"

namespace YAML {
    class Node;
}

/**
 * @brief Per-type block definitions, overridable from a YAML file
 *
 * Expected file structure (one entry per block name):
 * @code
 * grass:
 *   is_hoverable: true
 *   is_visible: true
 *   is_breakable: true
 *   is_collidable: true
 *   is_replaceable: false
 * @endcode
 *
 * Entries with an unknown name or a missing/invalid flag are skipped with a
 * warning. Types without a loaded entry answer with builtinBlockDefinition().
 */
class BlockRegistry {
public:
    BlockRegistry();

    /**
     * @brief Loads definitions from a YAML file
     * @return False if the file cannot be read or is not a YAML mapping
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads definitions from YAML text
     * @return False if the text is not a YAML mapping
     */
    bool loadFromString(const std::string& text);

    /**
     * @brief Definition for a type (loaded, else built-in)
     */
    const BlockDefinition& get(BlockType type) const;

    /**
     * @brief Definition for a stored block id, unknown ids resolve to Missing
     */
    const BlockDefinition& getById(uint64_t id) const { return get(blockTypeFromId(id)); }

    /// True when a definition for the type was loaded from YAML
    bool isLoaded(BlockType type) const;

    /// Number of types with a loaded definition
    int count() const;

private:
    bool loadDocument(const YAML::Node& doc, const std::string& source);

    std::array<BlockDefinition, BLOCK_TYPE_COUNT> m_defs;
    std::array<bool, BLOCK_TYPE_COUNT> m_loaded;
};
