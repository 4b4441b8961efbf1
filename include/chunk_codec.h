/**
 * @file chunk_codec.h
 * @brief Binary encoding of a single chunk
 *
 * File layout (host byte order):
 * @code
 * u32  magic          'VXCK' (0x4B435856)
 * u32  version        1
 * i32  chunk x, i32 chunk y
 * u32  width, height, subchunkDepth, numSubchunks
 * per subchunk slot, bottom first:
 *   u8 present
 *   if present, per field in Field order:
 *     u8 present
 *     if present:
 *       u8   bit width
 *       u32  word count
 *       u64  words[word count]
 * @endcode
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "chunk.h"

namespace ChunkFormat {
    constexpr uint32_t MAGIC = 0x4B435856;   ///< "VXCK" read as little-endian u32
    constexpr uint32_t VERSION = 1;
    constexpr std::size_t HEADER_SIZE = 4 + 4 + 4 + 4 + 4 * 4;
}

/**
 * @brief Serialises a chunk
 * @throws ChunkEncodeError if a stored section cannot be represented
 */
std::vector<uint8_t> encodeChunk(const Chunk& chunk);

/**
 * @brief Rebuilds a chunk from encodeChunk output
 *
 * The stream must describe exactly the expected chunk coordinate and the
 * given dimensions. Nothing is returned unless the whole stream is valid.
 *
 * @throws ChunkDecodeError for a truncated, malformed or mismatched stream
 */
std::unique_ptr<Chunk> decodeChunk(const std::vector<uint8_t>& bytes,
                                   const ChunkPosition& expectedPosition,
                                   const ChunkDimensions& dims);
