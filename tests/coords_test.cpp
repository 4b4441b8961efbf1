/**
 * @file coords_test.cpp
 * @brief Tests for coordinate conversions and position enumeration
 *
 * Tests:
 * 1. Floor division and Euclidean remainder on negative inputs
 * 2. Global <-> chunk/local conversions and their inverse law
 * 3. Subchunk routing and vertical bounds
 * 4. Neighbour offsets and square enumeration
 * 5. Lazy position ranges
 */

#include "test_utils.h"
#include "coords.h"
#include "terrain_errors.h"
#include <climits>
#include <cstdlib>
#include <functional>
#include <set>
#include <utility>

namespace {

ChunkDimensions smallDims() {
    ChunkDimensions dims;
    dims.width = 2;
    dims.height = 3;
    dims.subchunkDepth = 2;
    dims.numSubchunks = 2;
    return dims;
}

} // namespace

// ============================================================
// Test 1: Integer Helpers
// ============================================================

TEST(FloorDivisionRoundsTowardNegativeInfinity) {
    ASSERT_EQ(floorDiv(0, 16), 0);
    ASSERT_EQ(floorDiv(15, 16), 0);
    ASSERT_EQ(floorDiv(16, 16), 1);
    ASSERT_EQ(floorDiv(-1, 16), -1);
    ASSERT_EQ(floorDiv(-16, 16), -1);
    ASSERT_EQ(floorDiv(-17, 16), -2);

    ASSERT_EQ(floorMod(-1, 16), 15);
    ASSERT_EQ(floorMod(-16, 16), 0);
    ASSERT_EQ(floorMod(-17, 16), 15);
    ASSERT_EQ(floorMod(33, 16), 1);

    std::cout << "✓ Floor division and remainder handle negatives\n";
}

TEST(FloorDivisionAtIntLimits) {
    ASSERT_EQ(floorDiv(INT_MIN, 3), -715827883);
    ASSERT_EQ(floorMod(INT_MIN, 3), 1);
    ASSERT_EQ(floorDiv(INT_MAX, 3), 715827882);
    ASSERT_EQ(floorMod(INT_MAX, 3), 1);
    ASSERT_EQ(floorDiv(INT_MIN, 16), -134217728);
    ASSERT_EQ(floorMod(INT_MIN, 16), 0);
    ASSERT_EQ(floorDiv(INT_MIN, 1), INT_MIN);
}

// ============================================================
// Test 2: Global <-> Chunk/Local
// ============================================================

TEST(BlockToChunkAndLocal) {
    ChunkDimensions dims;

    ASSERT_EQ(blockToChunk(BlockPosition(-1, 17, 40), dims), ChunkPosition(-1, 1));
    ASSERT_EQ(globalToLocal(BlockPosition(-1, 17, 40), dims), glm::ivec3(15, 1, 40));

    ASSERT_EQ(blockToChunk(BlockPosition(-16, -17, 0), dims), ChunkPosition(-1, -2));
    ASSERT_EQ(globalToLocal(BlockPosition(-16, -17, 0), dims), glm::ivec3(0, 15, 0));

    ASSERT_EQ(blockToChunk(BlockPosition(15, 16, 255), dims), ChunkPosition(0, 1));
    ASSERT_EQ(chunkToBlockOrigin(ChunkPosition(-2, 3), dims), BlockPosition(-32, 48, 0));

    std::cout << "✓ Global positions resolve to chunk and local coordinates\n";
}

TEST(OriginPlusLocalReconstructsPosition) {
    ChunkDimensions dims;
    dims.width = 5;
    dims.height = 7;

    for (int x = -40; x <= 40; x++) {
        for (int y = -40; y <= 40; y += 3) {
            BlockPosition pos(x, y, 9);
            glm::ivec3 local = globalToLocal(pos, dims);
            BlockPosition origin = chunkToBlockOrigin(blockToChunk(pos, dims), dims);

            ASSERT_GE(local.x, 0);
            ASSERT_LT(local.x, dims.width);
            ASSERT_GE(local.y, 0);
            ASSERT_LT(local.y, dims.height);
            ASSERT_EQ(local.z, pos.z);
            ASSERT_EQ(origin.x + local.x, pos.x);
            ASSERT_EQ(origin.y + local.y, pos.y);
        }
    }

    std::cout << "✓ Chunk origin + local position is the global position\n";
}

TEST(ConversionsAtIntLimits) {
    ChunkDimensions dims;
    dims.width = 3;
    dims.height = 3;

    const BlockPosition lowest(INT_MIN, INT_MIN + 5, 7);
    ASSERT_EQ(blockToChunk(lowest, dims), ChunkPosition(-715827883, -715827881));
    ASSERT_EQ(globalToLocal(lowest, dims), glm::ivec3(1, 0, 7));

    // The lowest chunk starts below INT_MIN, so its origin cannot be expressed
    ASSERT_THROWS(chunkToBlockOrigin(ChunkPosition(-715827883, 0), dims), BoundsError);
    ASSERT_EQ(chunkToBlockOrigin(ChunkPosition(-715827882, 0), dims), BlockPosition(-2147483646, 0, 0));
    ASSERT_EQ(blockPositionsInChunk(ChunkPosition(-715827882, 0), dims).size(), dims.chunkVolume());

    // Origin fits but the far edge does not
    ASSERT_EQ(chunkToBlockOrigin(ChunkPosition(715827882, 0), dims), BlockPosition(2147483646, 0, 0));
    ASSERT_THROWS(blockPositionsInChunk(ChunkPosition(715827882, 0), dims), BoundsError);

    std::cout << "✓ Conversions stay exact at the int limits\n";
}

// ============================================================
// Test 3: Subchunk Routing
// ============================================================

TEST(SubchunkIndexAndLocal) {
    ChunkDimensions dims;

    ASSERT_EQ(subchunkIndex(glm::ivec3(0, 0, 0), dims), 0);
    ASSERT_EQ(subchunkIndex(glm::ivec3(0, 0, 15), dims), 0);
    ASSERT_EQ(subchunkIndex(glm::ivec3(0, 0, 16), dims), 1);
    ASSERT_EQ(subchunkIndex(glm::ivec3(0, 0, 255), dims), 15);
    ASSERT_EQ(localToSubchunkLocal(glm::ivec3(3, 4, 37), dims), glm::ivec3(3, 4, 5));

    ASSERT_THROWS(subchunkIndex(glm::ivec3(0, 0, 256), dims), BoundsError);
    ASSERT_THROWS(subchunkIndex(glm::ivec3(0, 0, -1), dims), BoundsError);

    std::cout << "✓ Vertical coordinates route to the right subchunk\n";
}

// ============================================================
// Test 4: Neighbours and Squares
// ============================================================

TEST(ChunkNeighborsAreTheFourSides) {
    auto neighbors = chunkNeighbors(ChunkPosition(3, -2));
    ASSERT_EQ(neighbors.size(), 4u);

    ASSERT_EQ(neighbors[0], ChunkPosition(2, -2));
    ASSERT_EQ(neighbors[1], ChunkPosition(4, -2));
    ASSERT_EQ(neighbors[2], ChunkPosition(3, -3));
    ASSERT_EQ(neighbors[3], ChunkPosition(3, -1));
}

TEST(NeighborsAtIntLimits) {
    auto edge = chunkNeighbors(ChunkPosition(INT_MIN, 0));
    ASSERT_EQ(edge.size(), 3u);
    ASSERT_EQ(edge[0], ChunkPosition(INT_MIN + 1, 0));
    ASSERT_EQ(edge[1], ChunkPosition(INT_MIN, -1));
    ASSERT_EQ(edge[2], ChunkPosition(INT_MIN, 1));

    ASSERT_EQ(chunkNeighbors(ChunkPosition(INT_MAX, INT_MAX)).size(), 2u);
    ASSERT_EQ(blockNeighbors(BlockPosition(INT_MAX, 0, 10), ChunkDimensions{}).size(), 5u);
    ASSERT_EQ(positionsInSquare(ChunkPosition(INT_MIN, 0), 1).size(), 6u);
}

TEST(ChunkPositionHashSpreadsNearbyCoordinates) {
    std::hash<glm::ivec2> hasher;

    ASSERT_NE(hasher(ChunkPosition(2, 0)), hasher(ChunkPosition(0, 1)));
    ASSERT_NE(hasher(ChunkPosition(1, 0)), hasher(ChunkPosition(0, 1)));

    std::set<std::size_t> hashes;
    for (const auto& pos : positionsInSquare(ChunkPosition(0, 0), 4)) {
        hashes.insert(hasher(pos));
    }
    ASSERT_EQ(hashes.size(), 81u);
}

TEST(BlockNeighborsFilterVerticalExtent) {
    ChunkDimensions dims;

    auto middle = blockNeighbors(BlockPosition(0, 0, 10), dims);
    ASSERT_EQ(middle.size(), 6u);
    ASSERT_EQ(middle[0], BlockPosition(1, 0, 10));
    ASSERT_EQ(middle[5], BlockPosition(0, 0, 9));

    auto bottom = blockNeighbors(BlockPosition(-5, 2, 0), dims);
    ASSERT_EQ(bottom.size(), 5u);
    for (const auto& pos : bottom) {
        ASSERT_GE(pos.z, 0);
    }

    auto top = blockNeighbors(BlockPosition(0, 0, dims.depth() - 1), dims);
    ASSERT_EQ(top.size(), 5u);
    for (const auto& pos : top) {
        ASSERT_LT(pos.z, dims.depth());
    }

    std::cout << "✓ Block neighbours stay inside the vertical extent\n";
}

TEST(PositionsInSquare) {
    auto single = positionsInSquare(ChunkPosition(4, 4), 0);
    ASSERT_EQ(single.size(), 1u);
    ASSERT_EQ(single[0], ChunkPosition(4, 4));

    auto square = positionsInSquare(ChunkPosition(-1, 2), 2);
    ASSERT_EQ(square.size(), 25u);

    std::set<std::pair<int, int>> unique;
    for (const auto& pos : square) {
        ASSERT_LE(std::abs(pos.x - (-1)), 2);
        ASSERT_LE(std::abs(pos.y - 2), 2);
        unique.insert({pos.x, pos.y});
    }
    ASSERT_EQ(unique.size(), 25u);

    ASSERT_TRUE(positionsInSquare(ChunkPosition(0, 0), -1).empty());
}

// ============================================================
// Test 5: Position Ranges
// ============================================================

TEST(PositionRangeOrderXOuterZInner) {
    ChunkDimensions dims = smallDims();
    PositionRange range(glm::ivec3(0), glm::ivec3(dims.width, dims.height, dims.depth()));

    std::vector<glm::ivec3> positions(range.begin(), range.end());
    ASSERT_EQ(positions.size(), dims.chunkVolume());
    ASSERT_EQ(positions[0], glm::ivec3(0, 0, 0));
    ASSERT_EQ(positions[1], glm::ivec3(0, 0, 1));
    ASSERT_EQ(positions[4], glm::ivec3(0, 1, 0));
    ASSERT_EQ(positions[12], glm::ivec3(1, 0, 0));
    ASSERT_EQ(positions.back(), glm::ivec3(1, 2, 3));

    // Restartable
    size_t second = 0;
    for (const auto& pos : range) {
        ASSERT_EQ(pos, positions[second]);
        second++;
    }
    ASSERT_EQ(second, positions.size());
}

TEST(BlockPositionsInChunks) {
    ChunkDimensions dims = smallDims();

    PositionRange single = blockPositionsInChunk(ChunkPosition(-1, 1), dims);
    ASSERT_EQ(single.size(), dims.chunkVolume());
    ASSERT_EQ(*single.begin(), BlockPosition(-2, 3, 0));

    std::vector<ChunkPosition> chunks = { ChunkPosition(0, 0), ChunkPosition(5, -1) };
    auto positions = blockPositionsInChunks(chunks, dims);
    ASSERT_EQ(positions.size(), 2 * dims.chunkVolume());
    ASSERT_EQ(positions[0], BlockPosition(0, 0, 0));
    ASSERT_EQ(positions[dims.chunkVolume()], BlockPosition(10, -3, 0));

    for (size_t i = dims.chunkVolume(); i < positions.size(); i++) {
        ASSERT_EQ(blockToChunk(positions[i], dims), ChunkPosition(5, -1));
    }

    std::cout << "✓ Block positions of chunks are enumerated in order\n";
}

// ============================================================
// Main Entry Point
// ============================================================

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
