/**
 * @file coords.h
 * @brief Conversions between global block space, chunk space and local space
 *
 * Coordinate System:
 * - X and Y are horizontal, Z is vertical
 * - A chunk covers width x height columns and the full vertical extent
 * - Chunk coordinates can be negative (the plane is unbounded)
 * - Local coordinates always lie in [0, width) x [0, height) x [0, depth)
 *
 * Usage Example:
 * @code
 * ChunkDimensions dims;                       // 16 x 16 x (16 x 16)
 * BlockPosition pos(-1, 17, 40);
 * ChunkPosition chunk = blockToChunk(pos, dims);   // (-1, 1)
 * glm::ivec3 local = globalToLocal(pos, dims);     // (15, 1, 40)
 * int slot = subchunkIndex(local, dims);           // 2
 * glm::ivec3 inSlot = localToSubchunkLocal(local, dims);  // (15, 1, 8)
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <vector>
#include <glm/glm.hpp>
#include "chunk_dimensions.h"

using ChunkPosition = glm::ivec2;  ///< Chunk coordinate on the horizontal plane
using BlockPosition = glm::ivec3;  ///< Global block coordinate

/**
 * @brief Hash specialisation so chunk coordinates can key unordered containers
 */
namespace std {
    template<>
    struct hash<glm::ivec2> {
        size_t operator()(const glm::ivec2& v) const {
            // Both 32-bit halves packed, then spread by an odd multiplier (a bijection)
            uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(v.x)) << 32) |
                              static_cast<uint32_t>(v.y);
            return static_cast<size_t>(packed * 0x9E3779B97F4A7C15ULL);
        }
    };
}

/// Floor division (rounds toward negative infinity)
int floorDiv(int value, int divisor);

/// Euclidean remainder, always in [0, divisor)
int floorMod(int value, int divisor);

/**
 * @brief Chunk containing a global block position
 *
 * Horizontal components are floor-divided by width/height, so -1 maps to
 * chunk -1, not chunk 0.
 */
ChunkPosition blockToChunk(const BlockPosition& pos, const ChunkDimensions& dims);

/**
 * @brief Position within the owning chunk; the vertical component is unchanged
 */
glm::ivec3 globalToLocal(const BlockPosition& pos, const ChunkDimensions& dims);

/**
 * @brief Reduces the vertical component of a chunk-local position to its subchunk
 */
glm::ivec3 localToSubchunkLocal(const glm::ivec3& localPos, const ChunkDimensions& dims);

/**
 * @brief Index of the subchunk holding a chunk-local position
 *
 * @throws BoundsError if localPos.z is outside [0, dims.depth())
 */
int subchunkIndex(const glm::ivec3& localPos, const ChunkDimensions& dims);

/**
 * @brief Global position of the chunk's local (0, 0, 0)
 * @throws BoundsError if the origin does not fit in int block coordinates
 */
BlockPosition chunkToBlockOrigin(const ChunkPosition& chunkPos, const ChunkDimensions& dims);

/**
 * @brief The horizontal neighbours in the order -x, +x, -y, +y
 *
 * Always 4 entries except at the edge of the int coordinate range, where
 * neighbours that cannot be represented are left out.
 */
std::vector<ChunkPosition> chunkNeighbors(const ChunkPosition& pos);

/**
 * @brief Face neighbours (+x, +y, +z, -x, -y, -z) that lie within the vertical extent
 *
 * Horizontal neighbours are only filtered at the edge of the int coordinate range.
 */
std::vector<BlockPosition> blockNeighbors(const BlockPosition& pos, const ChunkDimensions& dims);

/**
 * @brief Every chunk coordinate within Chebyshev distance radius of origin
 *
 * Returns (2r+1)^2 entries, empty for a negative radius. Coordinates past
 * the int range are left out.
 */
std::vector<ChunkPosition> positionsInSquare(const ChunkPosition& origin, int radius);

/**
 * @brief Lazy, restartable range over an axis-aligned box of positions
 *
 * Yields origin + (x, y, z) for x in [0, extent.x), y in [0, extent.y),
 * z in [0, extent.z), with x outermost and z innermost.
 */
class PositionRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = glm::ivec3;
        using difference_type = std::ptrdiff_t;
        using pointer = const glm::ivec3*;
        using reference = glm::ivec3;

        Iterator() = default;
        Iterator(const PositionRange* range, std::size_t index) : m_range(range), m_index(index) {}

        glm::ivec3 operator*() const { return m_range->at(m_index); }

        Iterator& operator++() {
            ++m_index;
            return *this;
        }

        Iterator operator++(int) {
            Iterator previous = *this;
            ++m_index;
            return previous;
        }

        bool operator==(const Iterator& other) const { return m_index == other.m_index; }
        bool operator!=(const Iterator& other) const { return m_index != other.m_index; }

    private:
        const PositionRange* m_range = nullptr;
        std::size_t m_index = 0;
    };

    PositionRange(const glm::ivec3& origin, const glm::ivec3& extent);

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, m_size); }

    std::size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }

    /// Position at a linear index in iteration order
    glm::ivec3 at(std::size_t index) const;

private:
    glm::ivec3 m_origin;
    glm::ivec3 m_extent;
    std::size_t m_size;
};

/**
 * @brief Every global block position of a chunk, lazily
 * @throws BoundsError if part of the chunk lies outside int block coordinates
 */
PositionRange blockPositionsInChunk(const ChunkPosition& chunkPos, const ChunkDimensions& dims);

/**
 * @brief Concatenation of blockPositionsInChunk over a list of chunks
 *
 * Materialised, so intended for small lists (tests, tooling).
 */
std::vector<BlockPosition> blockPositionsInChunks(const std::vector<ChunkPosition>& chunks,
                                                  const ChunkDimensions& dims);
