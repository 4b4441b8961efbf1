/**
 * @file world.h
 * @brief Resident chunk map, dirty tracking and chunk persistence
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <glm/glm.hpp>
#include "chunk.h"
#include "chunk_dimensions.h"
#include "coords.h"
#include "field.h"

/**
 * @brief Owns every resident chunk of an unbounded horizontal plane
 *
 * The World class is the entry point for voxel access by global coordinate. It handles:
 * - Chunk residency: chunks are added empty, unloaded to disk and loaded back
 * - Field access at global positions, routed to the owning chunk
 * - Dirty tracking: a write marks its chunk and the 4 horizontal neighbours,
 *   since faces and light on a chunk border depend on the adjacent column
 *
 * World coordinates:
 * - X and Y are horizontal and unbounded, Z is vertical in [0, depth)
 * - Chunk (cx, cy) covers x in [cx * width, (cx + 1) * width), same for y
 *
 * Persistence:
 * - One file per chunk: <chunksDirectory>/<x>_<y>.bin
 * - See chunk_codec.h for the layout
 *
 * Reading a position whose chunk is not resident throws ChunkUnloadedError.
 * Missing subchunks and sections below a resident chunk read as defaults.
 *
 * @note Not thread-safe. The owner serialises access.
 */
class World {
public:
    /**
     * @brief Constructs an empty world
     *
     * @param dims Chunk geometry shared by every chunk in this world
     * @param chunksDirectory Directory holding the per-chunk files (created on first save)
     * @throws ConfigError if dims fails validation
     */
    explicit World(const ChunkDimensions& dims, const std::string& chunksDirectory = "chunks");

    // Non-copyable
    World(const World&) = delete;
    World& operator=(const World&) = delete;

    const ChunkDimensions& dimensions() const { return m_dims; }
    const std::string& chunksDirectory() const { return m_chunksDirectory; }

    // ========== Chunk residency ==========

    /**
     * @brief Resident chunk at a chunk coordinate
     * @throws ChunkUnloadedError if no chunk is resident there
     */
    Chunk& chunkAt(const ChunkPosition& pos);
    const Chunk& chunkAt(const ChunkPosition& pos) const;

    /**
     * @brief Resident chunk at a chunk coordinate, or nullptr
     */
    Chunk* getChunkAt(const ChunkPosition& pos);
    const Chunk* getChunkAt(const ChunkPosition& pos) const;

    bool hasChunk(const ChunkPosition& pos) const;
    std::size_t loadedChunkCount() const { return m_chunkMap.size(); }

    /// Coordinates of every resident chunk, in no particular order
    std::vector<ChunkPosition> loadedChunkPositions() const;

    /**
     * @brief Resident chunks within Chebyshev distance radius of origin
     *
     * Non-resident coordinates in the square are skipped.
     */
    std::vector<const Chunk*> chunksInSquare(const ChunkPosition& origin, int radius) const;

    /**
     * @brief Inserts an all-default chunk
     * @throws ChunkAlreadyLoadedError if a chunk is already resident (nothing changes)
     */
    Chunk& addEmptyChunk(const ChunkPosition& pos);

    // ========== Field access ==========

    /**
     * @brief Encoded field value at a global position
     * @throws ChunkUnloadedError if the owning chunk is not resident
     * @throws BoundsError if pos.z is outside [0, depth)
     */
    uint64_t item(Field field, const BlockPosition& pos) const;

    /**
     * @brief Writes an encoded field value and marks the affected chunks dirty
     * @throws ChunkUnloadedError if the owning chunk is not resident
     * @throws BoundsError if pos.z is outside [0, depth)
     * @throws FieldOverflowError if value does not fit the field
     */
    void setItem(Field field, const BlockPosition& pos, uint64_t value);

    template<typename F>
    typename F::value_type get(const BlockPosition& pos) const {
        return F::fromBits(item(F::id, pos));
    }

    template<typename F>
    void set(const BlockPosition& pos, typename F::value_type value) {
        setItem(F::id, pos, F::toBits(value));
    }

    uint8_t getBlock(const BlockPosition& pos) const { return get<BlockField>(pos); }
    void setBlock(const BlockPosition& pos, uint8_t blockId) { set<BlockField>(pos, blockId); }

    uint8_t getSkyLight(const BlockPosition& pos) const { return get<SkyLightField>(pos); }
    void setSkyLight(const BlockPosition& pos, uint8_t value) { set<SkyLightField>(pos, value); }

    uint8_t getBlockLight(const BlockPosition& pos) const { return get<BlockLightField>(pos); }
    void setBlockLight(const BlockPosition& pos, uint8_t value) { set<BlockLightField>(pos, value); }

    bool isExposed(const BlockPosition& pos) const { return get<ExposedField>(pos); }
    void setExposed(const BlockPosition& pos, bool exposed) { set<ExposedField>(pos, exposed); }

    // ========== Dirty tracking ==========

    /**
     * @brief Marks a chunk coordinate as modified
     *
     * The coordinate does not need to be resident; consumeDirty() filters
     * out anything that is not resident when it runs.
     */
    void markChunkDirty(const ChunkPosition& pos);

    /**
     * @brief Empties the dirty set and returns its resident members
     *
     * Each coordinate appears at most once. A second call with no writes in
     * between returns nothing.
     */
    std::vector<ChunkPosition> consumeDirty();

    // ========== Persistence ==========

    /**
     * @brief Path of the file backing a chunk coordinate
     */
    std::string chunkFilePath(const ChunkPosition& pos) const;

    /**
     * @brief Writes a resident chunk to disk and removes it from memory
     *
     * The chunk is only removed after its file was written. On any failure
     * it stays resident and unchanged.
     *
     * @throws ChunkUnloadedError if no chunk is resident at pos
     * @throws ChunkEncodeError if the chunk cannot be serialised
     * @throws ChunkIoError if the file cannot be written
     */
    void unloadChunk(const ChunkPosition& pos);

    /**
     * @brief Reads a chunk file and makes the chunk resident
     *
     * Loaded chunks are not marked dirty.
     *
     * @throws ChunkAlreadyLoadedError if a chunk is already resident at pos
     * @throws ChunkIoError if the file is missing or unreadable
     * @throws ChunkDecodeError if the file contents are invalid (world unchanged)
     */
    void loadChunk(const ChunkPosition& pos);

    /**
     * @brief Writes a resident chunk to disk, keeping it resident
     * @throws ChunkUnloadedError, ChunkEncodeError, ChunkIoError as for unloadChunk()
     */
    void saveChunk(const ChunkPosition& pos) const;

    /**
     * @brief Loads the chunk if its file exists, otherwise adds an empty one
     *
     * @return True if the chunk came from disk
     * @throws ChunkAlreadyLoadedError if a chunk is already resident at pos
     * @throws ChunkIoError if the file cannot be checked or read
     * @throws ChunkDecodeError if an existing file is invalid
     */
    bool loadOrCreateChunk(const ChunkPosition& pos);

private:
    std::vector<uint8_t> encodeForSave(const Chunk& chunk) const;
    void writeChunkFile(const ChunkPosition& pos, const std::vector<uint8_t>& bytes) const;
    std::vector<uint8_t> readChunkFile(const ChunkPosition& pos) const;

    ChunkDimensions m_dims;
    std::string m_chunksDirectory;
    std::unordered_map<ChunkPosition, std::unique_ptr<Chunk>> m_chunkMap;  ///< Resident chunks by coordinate
    std::unordered_set<ChunkPosition> m_dirtyChunks;                      ///< Modified since the last consumeDirty()
};
