#include "subchunk.h"
#include "terrain_errors.h"
#include <stdexcept>

Subchunk::Subchunk(const glm::ivec3& extent)
    : m_extent(extent) {
}

uint64_t Subchunk::item(Field field, const glm::ivec3& pos) const {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside subchunk");
    }

    const auto& section = m_sections[fieldIndex(field)];
    if (!section) {
        return fieldDescriptor(field).defaultBits;
    }
    return section->item(pos);
}

void Subchunk::setItem(Field field, const glm::ivec3& pos, uint64_t value) {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside subchunk");
    }

    const FieldDescriptor& descriptor = fieldDescriptor(field);
    if (value > fieldMaxValue(field)) {
        throw FieldOverflowError(descriptor.name, value, descriptor.bits);
    }

    auto& section = m_sections[fieldIndex(field)];
    if (!section) {
        if (value == descriptor.defaultBits) {
            return;
        }
        section = std::make_unique<Section>(descriptor.bits, m_extent);
    }

    section->setItem(pos, value);
    if (section->isEmpty()) {
        section.reset();
    }
}

bool Subchunk::isEmpty() const {
    for (const auto& section : m_sections) {
        if (section) {
            return false;
        }
    }
    return true;
}

std::size_t Subchunk::allocatedSectionCount() const {
    std::size_t count = 0;
    for (const auto& section : m_sections) {
        if (section) {
            count++;
        }
    }
    return count;
}

void Subchunk::adoptSection(Field field, std::unique_ptr<Section> section) {
    if (!section) {
        m_sections[fieldIndex(field)].reset();
        return;
    }
    if (section->extent() != m_extent || section->bits() != fieldDescriptor(field).bits) {
        throw std::invalid_argument("section shape does not match subchunk field");
    }
    if (section->isEmpty()) {
        m_sections[fieldIndex(field)].reset();
        return;
    }
    m_sections[fieldIndex(field)] = std::move(section);
}
