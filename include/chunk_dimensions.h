/**
 * @file chunk_dimensions.h
 * @brief Runtime chunk geometry shared by every level of the storage hierarchy
 */

#pragma once

#include <cstddef>
#include <glm/glm.hpp>

/**
 * @brief Chunk geometry, validated once when a World is constructed
 *
 * A chunk covers width x height blocks horizontally and is split vertically
 * into numSubchunks slabs of subchunkDepth layers each. Every derived size
 * (chunk depth, subchunk volume, subchunk index bound) comes from here.
 *
 * Axes: x = width, y = height (both horizontal), z = vertical.
 */
struct ChunkDimensions {
    static constexpr int MAX_EXTENT = 1024;  ///< Upper bound for any single dimension

    int width = 16;          ///< Blocks along X
    int height = 16;         ///< Blocks along Y
    int subchunkDepth = 16;  ///< Vertical layers per subchunk
    int numSubchunks = 16;   ///< Subchunks stacked along Z

    /// Total vertical layers in a chunk
    int depth() const { return subchunkDepth * numSubchunks; }

    /// Extent of one subchunk as (width, height, subchunkDepth)
    glm::ivec3 subchunkExtent() const { return glm::ivec3(width, height, subchunkDepth); }

    std::size_t subchunkVolume() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
               static_cast<std::size_t>(subchunkDepth);
    }

    std::size_t chunkVolume() const {
        return subchunkVolume() * static_cast<std::size_t>(numSubchunks);
    }

    /**
     * @brief Checks every dimension is in [1, MAX_EXTENT]
     * @throws ConfigError naming the first offending dimension
     */
    void validate() const;

    bool operator==(const ChunkDimensions& other) const {
        return width == other.width && height == other.height &&
               subchunkDepth == other.subchunkDepth && numSubchunks == other.numSubchunks;
    }
    bool operator!=(const ChunkDimensions& other) const { return !(*this == other); }
};
