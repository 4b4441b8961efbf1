/**
 * @file subchunk.h
 * @brief One vertical slab of a chunk: a lazily allocated Section per field
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include "field.h"
#include "section.h"

/**
 * @brief Per-field Sections over a width x height x subchunkDepth box
 *
 * A missing Section reads as the field's default. Sections are allocated on
 * the first non-default write and released as soon as they return to all
 * default values, so an all-air unlit slab holds no Sections at all.
 */
class Subchunk {
public:
    explicit Subchunk(const glm::ivec3& extent);

    /**
     * @brief Encoded value of a field at a subchunk-local position
     * @throws BoundsError if pos lies outside the subchunk
     */
    uint64_t item(Field field, const glm::ivec3& pos) const;

    /**
     * @brief Writes an encoded field value
     *
     * Writing the default into a missing Section allocates nothing.
     *
     * @throws BoundsError if pos lies outside the subchunk
     * @throws FieldOverflowError if value does not fit the field (nothing is modified)
     */
    void setItem(Field field, const glm::ivec3& pos, uint64_t value);

    template<typename F>
    typename F::value_type get(const glm::ivec3& pos) const {
        return F::fromBits(item(F::id, pos));
    }

    template<typename F>
    void set(const glm::ivec3& pos, typename F::value_type value) {
        setItem(F::id, pos, F::toBits(value));
    }

    /// True when no field has an allocated Section
    bool isEmpty() const;

    std::size_t allocatedSectionCount() const;

    const glm::ivec3& extent() const { return m_extent; }

    /// Section for a field, nullptr when the field is all default
    const Section* section(Field field) const { return m_sections[fieldIndex(field)].get(); }

    /**
     * @brief Installs a decoded Section; an empty one is discarded
     * @throws std::invalid_argument if its extent or bit width do not match
     */
    void adoptSection(Field field, std::unique_ptr<Section> section);

    bool contains(const glm::ivec3& pos) const {
        return pos.x >= 0 && pos.x < m_extent.x &&
               pos.y >= 0 && pos.y < m_extent.y &&
               pos.z >= 0 && pos.z < m_extent.z;
    }

private:
    glm::ivec3 m_extent;
    std::array<std::unique_ptr<Section>, FIELD_COUNT> m_sections;
};
