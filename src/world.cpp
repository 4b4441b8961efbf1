/**
 * @file world.cpp
 * @brief World chunk map, dirty tracking and chunk file persistence
 */

#include "world.h"
#include "chunk_codec.h"
#include "logger.h"
#include "terrain_errors.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

World::World(const ChunkDimensions& dims, const std::string& chunksDirectory)
    : m_dims(dims), m_chunksDirectory(chunksDirectory) {
    m_dims.validate();
    if (m_chunksDirectory.empty()) {
        throw ConfigError("chunks directory must not be empty");
    }

    Logger::debug() << "World created: chunk " << m_dims.width << "x" << m_dims.height << "x"
                    << m_dims.depth() << " (" << m_dims.numSubchunks << " subchunks of "
                    << m_dims.subchunkDepth << "), storage '" << m_chunksDirectory << "'";
}

// ========== Chunk residency ==========

Chunk& World::chunkAt(const ChunkPosition& pos) {
    auto it = m_chunkMap.find(pos);
    if (it == m_chunkMap.end()) {
        throw ChunkUnloadedError(pos);
    }
    return *it->second;
}

const Chunk& World::chunkAt(const ChunkPosition& pos) const {
    auto it = m_chunkMap.find(pos);
    if (it == m_chunkMap.end()) {
        throw ChunkUnloadedError(pos);
    }
    return *it->second;
}

Chunk* World::getChunkAt(const ChunkPosition& pos) {
    auto it = m_chunkMap.find(pos);
    return (it != m_chunkMap.end()) ? it->second.get() : nullptr;
}

const Chunk* World::getChunkAt(const ChunkPosition& pos) const {
    auto it = m_chunkMap.find(pos);
    return (it != m_chunkMap.end()) ? it->second.get() : nullptr;
}

bool World::hasChunk(const ChunkPosition& pos) const {
    return m_chunkMap.find(pos) != m_chunkMap.end();
}

std::vector<ChunkPosition> World::loadedChunkPositions() const {
    std::vector<ChunkPosition> positions;
    positions.reserve(m_chunkMap.size());
    for (const auto& [pos, chunk] : m_chunkMap) {
        positions.push_back(pos);
    }
    return positions;
}

std::vector<const Chunk*> World::chunksInSquare(const ChunkPosition& origin, int radius) const {
    std::vector<const Chunk*> chunks;
    for (const auto& pos : positionsInSquare(origin, radius)) {
        const Chunk* chunk = getChunkAt(pos);
        if (chunk) {
            chunks.push_back(chunk);
        }
    }
    return chunks;
}

Chunk& World::addEmptyChunk(const ChunkPosition& pos) {
    if (hasChunk(pos)) {
        throw ChunkAlreadyLoadedError(pos);
    }
    auto chunk = std::make_unique<Chunk>(pos, m_dims);
    Chunk& ref = *chunk;
    m_chunkMap.emplace(pos, std::move(chunk));
    return ref;
}

// ========== Field access ==========

uint64_t World::item(Field field, const BlockPosition& pos) const {
    const Chunk& chunk = chunkAt(blockToChunk(pos, m_dims));
    return chunk.item(field, globalToLocal(pos, m_dims));
}

void World::setItem(Field field, const BlockPosition& pos, uint64_t value) {
    ChunkPosition chunkPos = blockToChunk(pos, m_dims);
    Chunk& chunk = chunkAt(chunkPos);
    chunk.setItem(field, globalToLocal(pos, m_dims), value);

    markChunkDirty(chunkPos);
    for (const auto& neighbor : chunkNeighbors(chunkPos)) {
        markChunkDirty(neighbor);
    }
}

// ========== Dirty tracking ==========

void World::markChunkDirty(const ChunkPosition& pos) {
    m_dirtyChunks.insert(pos);
}

std::vector<ChunkPosition> World::consumeDirty() {
    std::unordered_set<ChunkPosition> dirty;
    dirty.swap(m_dirtyChunks);

    std::vector<ChunkPosition> resident;
    resident.reserve(dirty.size());
    for (const auto& pos : dirty) {
        if (hasChunk(pos)) {
            resident.push_back(pos);
        }
    }
    return resident;
}

// ========== Persistence ==========

std::string World::chunkFilePath(const ChunkPosition& pos) const {
    namespace fs = std::filesystem;

    std::ostringstream oss;
    oss << pos.x << "_" << pos.y << ".bin";
    return (fs::path(m_chunksDirectory) / oss.str()).string();
}

void World::unloadChunk(const ChunkPosition& pos) {
    auto it = m_chunkMap.find(pos);
    if (it == m_chunkMap.end()) {
        throw ChunkUnloadedError(pos);
    }

    std::vector<uint8_t> bytes = encodeForSave(*it->second);
    writeChunkFile(pos, bytes);

    m_chunkMap.erase(it);
    Logger::debug() << "Unloaded chunk (" << pos.x << ", " << pos.y << "): " << bytes.size() << " bytes";
}

void World::loadChunk(const ChunkPosition& pos) {
    if (hasChunk(pos)) {
        throw ChunkAlreadyLoadedError(pos);
    }

    std::vector<uint8_t> bytes = readChunkFile(pos);
    std::unique_ptr<Chunk> chunk;
    try {
        chunk = decodeChunk(bytes, pos, m_dims);
    } catch (const ChunkDecodeError& e) {
        Logger::error() << "Failed to load chunk (" << pos.x << ", " << pos.y << ") from "
                        << chunkFilePath(pos) << ": " << e.what();
        throw;
    }

    m_chunkMap.emplace(pos, std::move(chunk));
    Logger::debug() << "Loaded chunk (" << pos.x << ", " << pos.y << "): " << bytes.size() << " bytes";
}

void World::saveChunk(const ChunkPosition& pos) const {
    const Chunk& chunk = chunkAt(pos);
    std::vector<uint8_t> bytes = encodeForSave(chunk);
    writeChunkFile(pos, bytes);
    Logger::debug() << "Saved chunk (" << pos.x << ", " << pos.y << "): " << bytes.size() << " bytes";
}

bool World::loadOrCreateChunk(const ChunkPosition& pos) {
    namespace fs = std::filesystem;

    if (hasChunk(pos)) {
        throw ChunkAlreadyLoadedError(pos);
    }

    const std::string path = chunkFilePath(pos);
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        // An unreadable path is not a missing file
        Logger::error() << "Failed to check chunk file " << path << ": " << ec.message();
        throw ChunkIoError(path, "cannot check file: " + ec.message());
    }
    if (found) {
        loadChunk(pos);
        return true;
    }

    addEmptyChunk(pos);
    return false;
}

std::vector<uint8_t> World::encodeForSave(const Chunk& chunk) const {
    try {
        return encodeChunk(chunk);
    } catch (const ChunkEncodeError& e) {
        Logger::error() << "Failed to encode chunk (" << chunk.position().x << ", "
                        << chunk.position().y << "): " << e.what();
        throw;
    }
}

void World::writeChunkFile(const ChunkPosition& pos, const std::vector<uint8_t>& bytes) const {
    namespace fs = std::filesystem;

    const std::string path = chunkFilePath(pos);

    // Create chunks directory if it doesn't exist
    std::error_code ec;
    fs::create_directories(m_chunksDirectory, ec);
    if (ec) {
        Logger::error() << "Failed to create chunk directory " << m_chunksDirectory << ": " << ec.message();
        throw ChunkIoError(path, "cannot create directory: " + ec.message());
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        Logger::error() << "Failed to open chunk file for writing: " << path;
        throw ChunkIoError(path, "cannot open for writing");
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        Logger::error() << "Failed to write chunk file: " << path;
        throw ChunkIoError(path, "write failed");
    }
}

std::vector<uint8_t> World::readChunkFile(const ChunkPosition& pos) const {
    namespace fs = std::filesystem;

    const std::string path = chunkFilePath(pos);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::string reason = ec ? ec.message() : "not a regular file";
        Logger::error() << "Failed to open chunk file " << path << ": " << reason;
        throw ChunkIoError(path, reason);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::error() << "Failed to open chunk file: " << path;
        throw ChunkIoError(path, "cannot open for reading");
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Logger::error() << "Failed to read chunk file: " << path;
        throw ChunkIoError(path, "read failed");
    }
    return bytes;
}
