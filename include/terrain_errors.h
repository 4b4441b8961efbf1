/**
 * @file terrain_errors.h
 * @brief Exception hierarchy for voxel access, chunk residency and persistence
 *
 * Every failure raised by the storage core derives from TerrainError, so a
 * caller of a persistence operation can catch the whole set in one handler
 * while per-voxel callers catch AccessError only.
 *
 * @code
 * try {
 *     world.setBlock(pos, 3);
 * } catch (const ChunkUnloadedError& e) {
 *     world.loadChunk(e.position());   // recoverable: bring the chunk in, retry
 *     world.setBlock(pos, 3);
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <glm/glm.hpp>

/**
 * @brief Base class of every storage-core failure
 */
class TerrainError : public std::runtime_error {
public:
    explicit TerrainError(const std::string& message) : std::runtime_error(message) {}
};

// ========== Per-voxel access ==========

/**
 * @brief Failure of a field get/set at a global position
 */
class AccessError : public TerrainError {
public:
    explicit AccessError(const std::string& message) : TerrainError(message) {}
};

/**
 * @brief A local position lies outside a Section's, Subchunk's or Chunk's volume
 */
class BoundsError : public AccessError {
public:
    explicit BoundsError(const glm::ivec3& position);
    BoundsError(const glm::ivec3& position, const std::string& detail);

    const glm::ivec3& position() const { return m_position; }

private:
    glm::ivec3 m_position;
};

/**
 * @brief A value does not fit in the bit width of the field it is written to
 */
class FieldOverflowError : public AccessError {
public:
    FieldOverflowError(const char* fieldName, uint64_t value, int bits);

    uint64_t value() const { return m_value; }

private:
    uint64_t m_value;
};

/**
 * @brief The requested chunk coordinate has no resident chunk
 */
class ChunkUnloadedError : public AccessError {
public:
    explicit ChunkUnloadedError(const glm::ivec2& position);

    const glm::ivec2& position() const { return m_position; }

private:
    glm::ivec2 m_position;
};

// ========== Chunk residency ==========

/**
 * @brief Attempt to create or load a chunk over one that is already resident
 */
class ChunkAlreadyLoadedError : public TerrainError {
public:
    explicit ChunkAlreadyLoadedError(const glm::ivec2& position);

    const glm::ivec2& position() const { return m_position; }

private:
    glm::ivec2 m_position;
};

// ========== Persistence ==========

/**
 * @brief A chunk file could not be opened, read or written
 */
class ChunkIoError : public TerrainError {
public:
    ChunkIoError(const std::string& path, const std::string& detail);

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @brief A chunk could not be serialised
 */
class ChunkEncodeError : public TerrainError {
public:
    explicit ChunkEncodeError(const std::string& detail)
        : TerrainError("chunk encode failed: " + detail) {}
};

/**
 * @brief A byte stream is not a valid encoded chunk (truncated, malformed, mismatched)
 */
class ChunkDecodeError : public TerrainError {
public:
    explicit ChunkDecodeError(const std::string& detail)
        : TerrainError("chunk decode failed: " + detail) {}
};

// ========== Configuration ==========

/**
 * @brief A configuration value failed validation
 */
class ConfigError : public TerrainError {
public:
    explicit ConfigError(const std::string& message) : TerrainError(message) {}
};
