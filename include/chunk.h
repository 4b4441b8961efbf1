/**
 * @file chunk.h
 * @brief Vertical column of voxels made of lazily allocated subchunks
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include "chunk_dimensions.h"
#include "coords.h"
#include "field.h"
#include "subchunk.h"

/**
 * @brief A width x height column spanning the full vertical extent
 *
 * The column is divided into numSubchunks slabs of subchunkDepth layers.
 * Slabs are created on the first non-default write and dropped again once
 * every field in them is back to its default, so an untouched chunk costs
 * one pointer per slab.
 *
 * All positions taken by Chunk are chunk-local: x in [0, width),
 * y in [0, height), z in [0, depth). Anything else throws BoundsError.
 *
 * Usage Example:
 * @code
 * Chunk chunk(ChunkPosition(0, 0), dims);
 * chunk.setBlock(glm::ivec3(15, 1, 21), 3);
 * chunk.setSkyLight(glm::ivec3(15, 1, 22), 15);
 * uint8_t id = chunk.getBlock(glm::ivec3(15, 1, 21));   // 3
 * bool exposed = chunk.isExposed(glm::ivec3(0, 0, 0));  // false, never written
 * @endcode
 */
class Chunk {
public:
    Chunk(const ChunkPosition& position, const ChunkDimensions& dims);

    // Non-copyable, movable
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) noexcept = default;
    Chunk& operator=(Chunk&&) noexcept = default;

    const ChunkPosition& position() const { return m_position; }
    const ChunkDimensions& dimensions() const { return m_dims; }

    // ========== Generic field access ==========

    /**
     * @brief Encoded field value at a local position; default when nothing is stored
     * @throws BoundsError if pos lies outside the chunk
     */
    uint64_t item(Field field, const glm::ivec3& pos) const;

    /**
     * @brief Writes an encoded field value at a local position
     * @throws BoundsError if pos lies outside the chunk
     * @throws FieldOverflowError if value does not fit the field
     */
    void setItem(Field field, const glm::ivec3& pos, uint64_t value);

    template<typename F>
    typename F::value_type get(const glm::ivec3& pos) const {
        return F::fromBits(item(F::id, pos));
    }

    template<typename F>
    void set(const glm::ivec3& pos, typename F::value_type value) {
        setItem(F::id, pos, F::toBits(value));
    }

    // ========== Blocks ==========

    uint8_t getBlock(const glm::ivec3& pos) const { return get<BlockField>(pos); }
    void setBlock(const glm::ivec3& pos, uint8_t blockId) { set<BlockField>(pos, blockId); }

    // ========== Lighting ==========

    /// Sky light level (0-15)
    uint8_t getSkyLight(const glm::ivec3& pos) const { return get<SkyLightField>(pos); }
    void setSkyLight(const glm::ivec3& pos, uint8_t value) { set<SkyLightField>(pos, value); }

    /// Block light level (0-15)
    uint8_t getBlockLight(const glm::ivec3& pos) const { return get<BlockLightField>(pos); }
    void setBlockLight(const glm::ivec3& pos, uint8_t value) { set<BlockLightField>(pos, value); }

    // ========== Exposure ==========

    bool isExposed(const glm::ivec3& pos) const { return get<ExposedField>(pos); }
    void setExposed(const glm::ivec3& pos, bool exposed) { set<ExposedField>(pos, exposed); }

    // ========== Structure ==========

    /**
     * @brief Every local position, x outermost and z innermost
     *
     * The range is lazy and can be iterated any number of times.
     */
    PositionRange localPositions() const;

    bool contains(const glm::ivec3& pos) const {
        return pos.x >= 0 && pos.x < m_dims.width &&
               pos.y >= 0 && pos.y < m_dims.height &&
               pos.z >= 0 && pos.z < m_dims.depth();
    }

    /// True when no subchunk is allocated (every field at its default everywhere)
    bool isEmpty() const;

    std::size_t allocatedSubchunkCount() const;

    /// Subchunk at a slot index, nullptr when the slab is entirely default
    const Subchunk* subchunk(int index) const;

    /**
     * @brief Installs a decoded subchunk; an empty one leaves the slot vacant
     * @throws std::out_of_range for a bad index
     * @throws std::invalid_argument if the subchunk extent does not match
     */
    void adoptSubchunk(int index, std::unique_ptr<Subchunk> subchunk);

private:
    ChunkPosition m_position;
    ChunkDimensions m_dims;
    std::vector<std::unique_ptr<Subchunk>> m_subchunks;  ///< numSubchunks slots, bottom first
};
