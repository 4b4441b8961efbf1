/**
 * @file coords.cpp
 * @brief Coordinate conversions and position enumeration
 */

#include "coords.h"
#include "terrain_errors.h"
#include <cstdint>
#include <limits>
#include <string>

namespace {

// True when a + b is representable as int
bool sumFits(int a, int b) {
    int64_t sum = static_cast<int64_t>(a) + static_cast<int64_t>(b);
    return sum >= std::numeric_limits<int>::min() && sum <= std::numeric_limits<int>::max();
}

} // namespace

int floorMod(int value, int divisor) {
    int remainder = value % divisor;
    if (remainder < 0) {
        remainder += divisor;
    }
    return remainder;
}

int floorDiv(int value, int divisor) {
    int quotient = value / divisor;
    if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

ChunkPosition blockToChunk(const BlockPosition& pos, const ChunkDimensions& dims) {
    return ChunkPosition(floorDiv(pos.x, dims.width), floorDiv(pos.y, dims.height));
}

glm::ivec3 globalToLocal(const BlockPosition& pos, const ChunkDimensions& dims) {
    return glm::ivec3(floorMod(pos.x, dims.width), floorMod(pos.y, dims.height), pos.z);
}

glm::ivec3 localToSubchunkLocal(const glm::ivec3& localPos, const ChunkDimensions& dims) {
    return glm::ivec3(localPos.x, localPos.y, floorMod(localPos.z, dims.subchunkDepth));
}

int subchunkIndex(const glm::ivec3& localPos, const ChunkDimensions& dims) {
    int index = floorDiv(localPos.z, dims.subchunkDepth);
    if (index < 0 || index >= dims.numSubchunks) {
        throw BoundsError(localPos, "vertical coordinate outside [0, " +
                                    std::to_string(dims.depth()) + ")");
    }
    return index;
}

BlockPosition chunkToBlockOrigin(const ChunkPosition& chunkPos, const ChunkDimensions& dims) {
    int64_t x = static_cast<int64_t>(chunkPos.x) * dims.width;
    int64_t y = static_cast<int64_t>(chunkPos.y) * dims.height;
    if (x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max() ||
        y < std::numeric_limits<int>::min() || y > std::numeric_limits<int>::max()) {
        throw BoundsError(glm::ivec3(chunkPos.x, chunkPos.y, 0),
                          "chunk origin outside the block coordinate range");
    }
    return BlockPosition(static_cast<int>(x), static_cast<int>(y), 0);
}

std::vector<ChunkPosition> chunkNeighbors(const ChunkPosition& pos) {
    static const glm::ivec2 SIDE_OFFSETS[4] = {
        glm::ivec2(-1,  0),
        glm::ivec2( 1,  0),
        glm::ivec2( 0, -1),
        glm::ivec2( 0,  1)
    };

    std::vector<ChunkPosition> neighbors;
    neighbors.reserve(4);
    for (const auto& offset : SIDE_OFFSETS) {
        if (sumFits(pos.x, offset.x) && sumFits(pos.y, offset.y)) {
            neighbors.push_back(pos + offset);
        }
    }
    return neighbors;
}

std::vector<BlockPosition> blockNeighbors(const BlockPosition& pos, const ChunkDimensions& dims) {
    static const glm::ivec3 FACE_OFFSETS[6] = {
        glm::ivec3( 1,  0,  0),
        glm::ivec3( 0,  1,  0),
        glm::ivec3( 0,  0,  1),
        glm::ivec3(-1,  0,  0),
        glm::ivec3( 0, -1,  0),
        glm::ivec3( 0,  0, -1)
    };

    std::vector<BlockPosition> neighbors;
    neighbors.reserve(6);
    for (const auto& offset : FACE_OFFSETS) {
        if (!sumFits(pos.x, offset.x) || !sumFits(pos.y, offset.y) || !sumFits(pos.z, offset.z)) {
            continue;
        }
        BlockPosition neighbor = pos + offset;
        if (neighbor.z >= 0 && neighbor.z < dims.depth()) {
            neighbors.push_back(neighbor);
        }
    }
    return neighbors;
}

std::vector<ChunkPosition> positionsInSquare(const ChunkPosition& origin, int radius) {
    std::vector<ChunkPosition> positions;
    if (radius < 0) {
        return positions;
    }

    const std::size_t side = static_cast<std::size_t>(radius) * 2 + 1;
    positions.reserve(side * side);
    for (int dx = -radius; dx <= radius; dx++) {
        if (!sumFits(origin.x, dx)) {
            continue;
        }
        for (int dy = -radius; dy <= radius; dy++) {
            if (sumFits(origin.y, dy)) {
                positions.emplace_back(origin.x + dx, origin.y + dy);
            }
        }
    }
    return positions;
}

// ========== PositionRange ==========

PositionRange::PositionRange(const glm::ivec3& origin, const glm::ivec3& extent)
    : m_origin(origin), m_extent(extent), m_size(0) {
    if (extent.x > 0 && extent.y > 0 && extent.z > 0) {
        m_size = static_cast<std::size_t>(extent.x) * static_cast<std::size_t>(extent.y) *
                 static_cast<std::size_t>(extent.z);
    }
}

glm::ivec3 PositionRange::at(std::size_t index) const {
    const std::size_t depth = static_cast<std::size_t>(m_extent.z);
    const std::size_t height = static_cast<std::size_t>(m_extent.y);

    int z = static_cast<int>(index % depth);
    int y = static_cast<int>((index / depth) % height);
    int x = static_cast<int>(index / (depth * height));
    return m_origin + glm::ivec3(x, y, z);
}

PositionRange blockPositionsInChunk(const ChunkPosition& chunkPos, const ChunkDimensions& dims) {
    BlockPosition origin = chunkToBlockOrigin(chunkPos, dims);
    if (!sumFits(origin.x, dims.width - 1) || !sumFits(origin.y, dims.height - 1)) {
        throw BoundsError(glm::ivec3(chunkPos.x, chunkPos.y, 0),
                          "chunk extends past the block coordinate range");
    }
    return PositionRange(origin,
                         glm::ivec3(dims.width, dims.height, dims.depth()));
}

std::vector<BlockPosition> blockPositionsInChunks(const std::vector<ChunkPosition>& chunks,
                                                  const ChunkDimensions& dims) {
    std::vector<BlockPosition> positions;
    positions.reserve(chunks.size() * dims.chunkVolume());
    for (const auto& chunkPos : chunks) {
        for (const auto& pos : blockPositionsInChunk(chunkPos, dims)) {
            positions.push_back(pos);
        }
    }
    return positions;
}
