/**
 * @file main.cpp
 * @brief Command-line driver for the voxel terrain store
 *
 * Builds a world from config.ini, loads block definitions, writes a few
 * voxels across a chunk border, reports the dirty chunks, then unloads and
 * reloads a chunk and checks the values survived the round trip.
 *
 * Usage: voxel_terrain_demo [config.ini] [blocks.yaml]
 */

#include <iostream>
#include <string>
#include <vector>
#include "block_registry.h"
#include "config.h"
#include "coords.h"
#include "logger.h"
#include "terrain_errors.h"
#include "world.h"

namespace {

struct DemoWrite {
    BlockPosition pos;
    BlockType block;
    uint8_t skyLight;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = (argc > 1) ? argv[1] : "config.ini";
    std::string blocksPath = (argc > 2) ? argv[2] : "assets/blocks.yaml";

    try {
        // Load configuration first
        WorldSettings settings = loadWorldSettings(configPath);
        applyLoggingSettings(settings);

        BlockRegistry registry;
        if (!registry.loadFromFile(blocksPath)) {
            Logger::warning() << "Failed to load " << blocksPath << ", using built-in block definitions";
        }

        World world(settings.dimensions, settings.chunksDirectory);
        const ChunkDimensions& dims = world.dimensions();
        Logger::info() << "Chunk size " << dims.width << "x" << dims.height << "x" << dims.depth()
                       << ", storing chunks in '" << world.chunksDirectory() << "'";

        const ChunkPosition home(0, 0);
        const ChunkPosition west(-1, 0);
        world.loadOrCreateChunk(home);
        world.loadOrCreateChunk(west);

        // Writes straddle the x = 0 border between the two chunks
        const std::vector<DemoWrite> writes = {
            { BlockPosition(0, 1, 0), BlockType::Bedrock, 0 },
            { BlockPosition(0, 1, 1), BlockType::Stone, 0 },
            { BlockPosition(1, 1, 2), BlockType::Grass, 15 },
            { BlockPosition(-1, 1, 2), BlockType::Dirt, 12 },
        };
        for (const auto& write : writes) {
            world.setBlock(write.pos, blockTypeId(write.block));
            world.setSkyLight(write.pos + BlockPosition(0, 0, 1), write.skyLight);
            world.setExposed(write.pos, registry.get(write.block).isVisible());
        }

        std::vector<ChunkPosition> dirty = world.consumeDirty();
        Logger::info() << dirty.size() << " resident chunks dirty after " << writes.size() << " writes";
        for (const auto& pos : dirty) {
            Logger::info() << "  dirty chunk (" << pos.x << ", " << pos.y << ")";
        }

        world.unloadChunk(home);
        try {
            world.getBlock(writes.front().pos);
        } catch (const ChunkUnloadedError& e) {
            Logger::info() << "Read after unload: " << e.what();
            world.loadChunk(e.position());
        }

        int mismatches = 0;
        for (const auto& write : writes) {
            BlockType stored = blockTypeFromId(world.getBlock(write.pos));
            uint8_t light = world.getSkyLight(write.pos + BlockPosition(0, 0, 1));
            if (stored != write.block || light != write.skyLight) {
                Logger::error() << "Mismatch at (" << write.pos.x << ", " << write.pos.y << ", " << write.pos.z
                                << "): " << blockTypeName(stored) << " light " << static_cast<int>(light);
                mismatches++;
                continue;
            }
            const BlockDefinition& def = registry.get(stored);
            Logger::info() << blockTypeName(stored) << " at (" << write.pos.x << ", " << write.pos.y << ", "
                           << write.pos.z << ") breakable=" << def.isBreakable()
                           << " collidable=" << def.isCollidable();
        }

        for (const auto& pos : world.loadedChunkPositions()) {
            world.saveChunk(pos);
        }

        if (mismatches > 0) {
            Logger::error() << mismatches << " voxels did not survive the reload";
            return 1;
        }
        Logger::info() << "Round trip OK";
        return 0;

    } catch (const TerrainError& e) {
        Logger::error() << "Terrain error: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
