#include "block.h"

namespace {

//                                type               hover  visible break  collide replace
const BlockDefinition BUILTIN_DEFINITIONS[BLOCK_TYPE_COUNT] = {
    BlockDefinition(BlockType::Air,     false, false, false, false, true),
    BlockDefinition(BlockType::Grass,   true,  true,  true,  true,  false),
    BlockDefinition(BlockType::Dirt,    true,  true,  true,  true,  false),
    BlockDefinition(BlockType::Stone,   true,  true,  true,  true,  false),
    BlockDefinition(BlockType::Bedrock, true,  true,  false, true,  false),
    BlockDefinition(BlockType::Missing, false, false, false, true,  false)
};

} // namespace

BlockType blockTypeFromId(uint64_t id) {
    if (id >= static_cast<uint64_t>(BlockType::Missing)) {
        return BlockType::Missing;
    }
    return static_cast<BlockType>(id);
}

BlockType blockTypeFromString(const std::string& name) {
    if (name == "air") return BlockType::Air;
    if (name == "grass") return BlockType::Grass;
    if (name == "dirt") return BlockType::Dirt;
    if (name == "stone") return BlockType::Stone;
    if (name == "bedrock") return BlockType::Bedrock;
    return BlockType::Missing;
}

const char* blockTypeName(BlockType type) {
    switch (type) {
        case BlockType::Air:     return "air";
        case BlockType::Grass:   return "grass";
        case BlockType::Dirt:    return "dirt";
        case BlockType::Stone:   return "stone";
        case BlockType::Bedrock: return "bedrock";
        default:                 return "missing";
    }
}

BlockDefinition::BlockDefinition(BlockType type, bool hoverable, bool visible, bool breakable,
                                 bool collidable, bool replaceable)
    : m_packed(static_cast<uint16_t>(blockTypeId(type) & TYPE_MASK)) {
    if (hoverable) m_packed |= HOVERABLE;
    if (visible) m_packed |= VISIBLE;
    if (breakable) m_packed |= BREAKABLE;
    if (collidable) m_packed |= COLLIDABLE;
    if (replaceable) m_packed |= REPLACEABLE;
}

const BlockDefinition& builtinBlockDefinition(BlockType type) {
    std::size_t index = static_cast<std::size_t>(type);
    if (index >= BLOCK_TYPE_COUNT) {
        index = static_cast<std::size_t>(BlockType::Missing);
    }
    return BUILTIN_DEFINITIONS[index];
}
