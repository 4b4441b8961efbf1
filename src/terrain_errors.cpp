/**
 * @file terrain_errors.cpp
 * @brief Message formatting for the storage-core exceptions
 */

#include "terrain_errors.h"
#include <sstream>

namespace {

std::string formatPosition(const glm::ivec3& p) {
    std::ostringstream oss;
    oss << "(" << p.x << ", " << p.y << ", " << p.z << ")";
    return oss.str();
}

std::string formatPosition(const glm::ivec2& p) {
    std::ostringstream oss;
    oss << "(" << p.x << ", " << p.y << ")";
    return oss.str();
}

} // namespace

BoundsError::BoundsError(const glm::ivec3& position)
    : AccessError("position " + formatPosition(position) + " is out of bounds"),
      m_position(position) {}

BoundsError::BoundsError(const glm::ivec3& position, const std::string& detail)
    : AccessError("position " + formatPosition(position) + " is out of bounds: " + detail),
      m_position(position) {}

FieldOverflowError::FieldOverflowError(const char* fieldName, uint64_t value, int bits)
    : AccessError("value " + std::to_string(value) + " does not fit in the " +
                  std::to_string(bits) + "-bit field '" + fieldName + "'"),
      m_value(value) {}

ChunkUnloadedError::ChunkUnloadedError(const glm::ivec2& position)
    : AccessError("chunk " + formatPosition(position) + " is currently unloaded"),
      m_position(position) {}

ChunkAlreadyLoadedError::ChunkAlreadyLoadedError(const glm::ivec2& position)
    : TerrainError("chunk " + formatPosition(position) + " already exists"),
      m_position(position) {}

ChunkIoError::ChunkIoError(const std::string& path, const std::string& detail)
    : TerrainError("chunk file " + path + ": " + detail),
      m_path(path) {}
