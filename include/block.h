/**
 * @file block.h
 * @brief Block types and their static capability flags
 *
 * The storage layer only stores block ids. This header maps those ids to
 * BlockType tags and carries the per-type capabilities gameplay code asks
 * about (can it be broken, does it collide, ...).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Closed set of block types, values are the stored block ids
 */
enum class BlockType : uint8_t {
    Air = 0,
    Grass,
    Dirt,
    Stone,
    Bedrock,
    Missing   ///< Fallback for ids and names that are not recognised
};

constexpr std::size_t BLOCK_TYPE_COUNT = 6;

/// Block type for a stored id; ids at or above Missing map to Missing
BlockType blockTypeFromId(uint64_t id);

/// Block type for a lowercase name ("air", "grass", ...); anything else maps to Missing
BlockType blockTypeFromString(const std::string& name);

const char* blockTypeName(BlockType type);

inline uint8_t blockTypeId(BlockType type) {
    return static_cast<uint8_t>(type);
}

/**
 * @brief Immutable capability record for one block type
 *
 * Packed layout (16 bits):
 * - bits 0-7:  block type tag
 * - bit 8:     hoverable
 * - bit 9:     visible
 * - bit 10:    breakable
 * - bit 11:    collidable
 * - bit 12:    replaceable
 */
class BlockDefinition {
public:
    static constexpr uint16_t TYPE_MASK = 0x00FF;
    static constexpr uint16_t HOVERABLE = 1 << 8;
    static constexpr uint16_t VISIBLE = 1 << 9;
    static constexpr uint16_t BREAKABLE = 1 << 10;
    static constexpr uint16_t COLLIDABLE = 1 << 11;
    static constexpr uint16_t REPLACEABLE = 1 << 12;

    BlockDefinition() : m_packed(blockTypeId(BlockType::Missing) | COLLIDABLE) {}

    BlockDefinition(BlockType type, bool hoverable, bool visible, bool breakable,
                    bool collidable, bool replaceable);

    BlockType type() const { return static_cast<BlockType>(m_packed & TYPE_MASK); }

    bool isHoverable() const { return (m_packed & HOVERABLE) != 0; }
    bool isVisible() const { return (m_packed & VISIBLE) != 0; }
    bool isBreakable() const { return (m_packed & BREAKABLE) != 0; }
    bool isCollidable() const { return (m_packed & COLLIDABLE) != 0; }
    bool isReplaceable() const { return (m_packed & REPLACEABLE) != 0; }

    uint16_t packed() const { return m_packed; }

    bool operator==(const BlockDefinition& other) const { return m_packed == other.m_packed; }
    bool operator!=(const BlockDefinition& other) const { return m_packed != other.m_packed; }

private:
    uint16_t m_packed;
};

/**
 * @brief Built-in definition for a type (air replaceable, solids collidable, ...)
 */
const BlockDefinition& builtinBlockDefinition(BlockType type);
