/**
 * @file chunk.cpp
 * @brief Chunk routing between local positions and subchunk slabs
 */

#include "chunk.h"
#include "terrain_errors.h"
#include <stdexcept>
#include <string>

Chunk::Chunk(const ChunkPosition& position, const ChunkDimensions& dims)
    : m_position(position), m_dims(dims) {
    m_subchunks.resize(static_cast<std::size_t>(dims.numSubchunks));
}

uint64_t Chunk::item(Field field, const glm::ivec3& pos) const {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside chunk");
    }

    int index = subchunkIndex(pos, m_dims);
    const auto& slab = m_subchunks[static_cast<std::size_t>(index)];
    if (!slab) {
        return fieldDescriptor(field).defaultBits;
    }
    return slab->item(field, localToSubchunkLocal(pos, m_dims));
}

void Chunk::setItem(Field field, const glm::ivec3& pos, uint64_t value) {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside chunk");
    }

    int index = subchunkIndex(pos, m_dims);
    auto& slab = m_subchunks[static_cast<std::size_t>(index)];
    if (!slab) {
        if (value == fieldDescriptor(field).defaultBits) {
            return;
        }
        // Materialise only after the value is known to fit, so an overflow leaves no empty slab
        if (value > fieldMaxValue(field)) {
            const FieldDescriptor& descriptor = fieldDescriptor(field);
            throw FieldOverflowError(descriptor.name, value, descriptor.bits);
        }
        slab = std::make_unique<Subchunk>(m_dims.subchunkExtent());
    }

    slab->setItem(field, localToSubchunkLocal(pos, m_dims), value);
    if (slab->isEmpty()) {
        slab.reset();
    }
}

PositionRange Chunk::localPositions() const {
    return PositionRange(glm::ivec3(0), glm::ivec3(m_dims.width, m_dims.height, m_dims.depth()));
}

bool Chunk::isEmpty() const {
    for (const auto& slab : m_subchunks) {
        if (slab) {
            return false;
        }
    }
    return true;
}

std::size_t Chunk::allocatedSubchunkCount() const {
    std::size_t count = 0;
    for (const auto& slab : m_subchunks) {
        if (slab) {
            count++;
        }
    }
    return count;
}

const Subchunk* Chunk::subchunk(int index) const {
    if (index < 0 || index >= m_dims.numSubchunks) {
        return nullptr;
    }
    return m_subchunks[static_cast<std::size_t>(index)].get();
}

void Chunk::adoptSubchunk(int index, std::unique_ptr<Subchunk> subchunk) {
    if (index < 0 || index >= m_dims.numSubchunks) {
        throw std::out_of_range("subchunk index " + std::to_string(index) + " out of range");
    }
    if (subchunk && subchunk->extent() != m_dims.subchunkExtent()) {
        throw std::invalid_argument("subchunk extent does not match chunk dimensions");
    }
    if (subchunk && subchunk->isEmpty()) {
        subchunk.reset();
    }
    m_subchunks[static_cast<std::size_t>(index)] = std::move(subchunk);
}
